#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <GeoFeature.hpp>
#include <QMainWindow>
#include <memory>
#include <string>
#include <vector>

class Core;
class QCheckBox;
class QLabel;
class QLineEdit;
class QTimer;
class QVulkanInstance;
class ParcelInfoPanel;
class ViewportManager;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @brief Creates the Vulkan instance, Core and the viewport.
     * @param sceneQuery Registered picking backend name ("cpu", "embree").
     * @throws std::runtime_error if @p sceneQuery is not registered.
     */
    explicit MainWindow(const std::string& sceneQuery, QWidget* parent = nullptr);
    ~MainWindow() noexcept override;

    /**
     * @brief Loads a GeoJSON file and replaces the displayed parcels.
     * @return False if the file could not be read; the current parcels stay
     *         and @p error (if given) receives the reason.
     */
    bool openGeoJson(const QString& path, QString* error = nullptr);

    /// Sets the highlight id input as if typed by the user.
    void setHighlightText(const QString& text);

private slots:
    void onOpenClicked();
    void onHighlightEdited();
    void onOnlyMatchesToggled(bool checked);

private:
    void buildMenus();
    QWidget* buildSidePanel();

    void onUiTick();

    /// Pushes the shown feature set (all, or only matches) into Core.
    void applyShownFeatures();
    void updateStatus();

    void enableVulkanValidationLayer();

private:
    std::unique_ptr<Core>            m_core;
    std::unique_ptr<QVulkanInstance> m_vkInstance;

    std::unique_ptr<ViewportManager> m_viewportManager;

    QTimer* m_uiTimer = nullptr;

    QLineEdit*       m_highlightEdit = nullptr;
    QCheckBox*       m_onlyMatches   = nullptr;
    QLabel*          m_statusLabel   = nullptr;
    QLabel*          m_statsLabel    = nullptr;
    ParcelInfoPanel* m_infoPanel     = nullptr;

    /// Every loaded feature; Core only sees the shown subset.
    std::vector<GeoFeature> m_allFeatures = {};

    uint64_t m_lastSceneStamp = 0ull;
};
#endif // MAINWINDOW_HPP
