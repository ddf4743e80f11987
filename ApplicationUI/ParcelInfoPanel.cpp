#include "ParcelInfoPanel.hpp"

#include <Core.hpp>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

#include "ParcelInfo.hpp"

ParcelInfoPanel::ParcelInfoPanel(QWidget* parent) : QWidget(parent)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);

    m_hoverCard = new QGroupBox(tr("Hover"), this);
    m_hoverForm = new QFormLayout(m_hoverCard);
    layout->addWidget(m_hoverCard);

    m_selectedCard = new QGroupBox(tr("Selected"), this);
    auto* selectedLayout = new QVBoxLayout(m_selectedCard);
    m_selectedForm       = new QFormLayout();
    selectedLayout->addLayout(m_selectedForm);

    m_clearButton = new QPushButton(tr("Clear"), m_selectedCard);
    m_clearButton->setSizePolicy(QSizePolicy::Fixed, QSizePolicy::Fixed);
    selectedLayout->addWidget(m_clearButton);
    layout->addWidget(m_selectedCard);

    connect(m_clearButton, &QPushButton::clicked, this, &ParcelInfoPanel::clearRequested);

    m_hoverCard->setVisible(false);
    m_selectedCard->setVisible(false);
}

void ParcelInfoPanel::idleEvent(Core* core)
{
    if (!core)
        return;

    const uint64_t stamp = core->pickStamp();
    if (stamp == m_lastStamp)
        return;

    m_lastStamp = stamp;

    setPicked(core->hovered(), core->selected());
}

void ParcelInfoPanel::setPicked(FeatureAttributesPtr hovered, FeatureAttributesPtr selected)
{
    if (selected)
        fillCard(m_selectedForm, *selected);
    m_selectedCard->setVisible(selected != nullptr);

    const bool showHover = hovered && !selected;
    if (showHover)
        fillCard(m_hoverForm, *hovered);
    m_hoverCard->setVisible(showHover);
}

void ParcelInfoPanel::fillCard(QFormLayout* form, const FeatureAttributes& attrs)
{
    while (form->rowCount() > 0)
        form->removeRow(0);

    for (const parcelinfo::Row& row : parcelinfo::rows(attrs))
    {
        auto* value = new QLabel(row.value);
        value->setTextInteractionFlags(Qt::TextSelectableByMouse);
        value->setWordWrap(true);
        form->addRow(QStringLiteral("<b>%1:</b>").arg(row.label), value);
    }
}
