#ifndef PARCELINFOPANEL_HPP
#define PARCELINFOPANEL_HPP

#include <GeoFeature.hpp>
#include <QWidget>
#include <cstdint>

class Core;
class QGroupBox;
class QFormLayout;
class QPushButton;

/**
 * @brief Hover and Selected parcel cards.
 *
 * The Hover card is only shown while nothing is selected. The Selected card
 * carries a Clear button that asks the owner to drop the selection.
 */
class ParcelInfoPanel : public QWidget
{
    Q_OBJECT

public:
    explicit ParcelInfoPanel(QWidget* parent = nullptr);

    /// Refreshes the cards when Core's pick stamp changed.
    void idleEvent(Core* core);

    void setPicked(FeatureAttributesPtr hovered, FeatureAttributesPtr selected);

signals:
    void clearRequested();

private:
    static void fillCard(QFormLayout* form, const FeatureAttributes& attrs);

private:
    QGroupBox*   m_hoverCard    = nullptr;
    QFormLayout* m_hoverForm    = nullptr;
    QGroupBox*   m_selectedCard = nullptr;
    QFormLayout* m_selectedForm = nullptr;
    QPushButton* m_clearButton  = nullptr;

    uint64_t m_lastStamp = 0ull;
};

#endif // PARCELINFOPANEL_HPP
