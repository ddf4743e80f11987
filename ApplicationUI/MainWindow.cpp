#include "MainWindow.hpp"

#include <QAction>
#include <QCheckBox>
#include <QDebug>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>
#include <QVulkanInstance>

#include "Core.hpp"
#include "GeoJsonLoader.hpp"
#include "MainUtilities.hpp"
#include "ParcelInfo.hpp"
#include "ParcelInfoPanel.hpp"
#include "ViewportManager.hpp"

namespace
{
    constexpr int kSidePanelWidth = 300;

    QString openFilter()
    {
        return QObject::tr(
            "GeoJSON Files (*.geojson *.json);;"
            "All Files (*.*)");
    }
} // namespace

MainWindow::MainWindow(const std::string& sceneQuery, QWidget* parent) :
    QMainWindow(parent),
    m_core(std::make_unique<Core>(ViewSettings{}, sceneQuery))
{
    resize(1280, 780);
    setWindowTitle("Parcel3D");

    // ------------------------------------------------------------
    // Create shared Vulkan instance
    // ------------------------------------------------------------
    m_vkInstance = std::make_unique<QVulkanInstance>();
    m_vkInstance->setApiVersion(QVersionNumber(1, 3));

    enableVulkanValidationLayer();

    if (!m_vkInstance->create())
    {
        fatalGpuError(this,
                      tr("Vulkan Error"),
                      tr("Failed to create a Vulkan instance. "
                         "This application requires a Vulkan-capable GPU and driver."));
    }

    // ------------------------------------------------------------
    // Central widget: viewport on the left, parcel panel on the right
    // ------------------------------------------------------------
    auto* central = new QWidget(this);
    auto* layout  = new QHBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_viewportManager = std::make_unique<ViewportManager>(central, m_core.get(), m_vkInstance.get());
    layout->addWidget(m_viewportManager.get(), 1);
    layout->addWidget(buildSidePanel());

    setCentralWidget(central);

    buildMenus();

    m_statsLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_statsLabel);

    updateStatus();

    m_uiTimer = new QTimer(this);
    m_uiTimer->setInterval(16); // ~60 fps
    connect(m_uiTimer, &QTimer::timeout, this, &MainWindow::onUiTick);
    m_uiTimer->start();
}

MainWindow::~MainWindow() noexcept
{
    // ------------------------------------------------------------
    // Vulkan teardown order:
    // 1) Viewport loop, swapchain and Core GPU resources, then the VkDevice
    // 2) Core (scene graph, picker, viewports)
    // 3) QVulkanInstance (VkInstance)
    // ------------------------------------------------------------
    if (m_uiTimer)
        m_uiTimer->stop();

    if (m_viewportManager)
        m_viewportManager->shutdownVulkan();

    m_viewportManager.reset();
    m_core.reset();

    m_vkInstance.reset();
}

void MainWindow::buildMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));

    QAction* openAction = fileMenu->addAction(tr("&Open GeoJSON..."));
    openAction->setShortcuts(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::onOpenClicked);

    fileMenu->addSeparator();

    QAction* exitAction = fileMenu->addAction(tr("E&xit"));
    exitAction->setShortcuts(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));

    QAction* clearAction = viewMenu->addAction(tr("Clear Selection"));
    clearAction->setShortcut(Qt::Key_Escape);
    connect(clearAction, &QAction::triggered, this, [this]() { m_core->clearSelected(); });
}

QWidget* MainWindow::buildSidePanel()
{
    auto* panel = new QWidget(this);
    panel->setFixedWidth(kSidePanelWidth);

    auto* layout = new QVBoxLayout(panel);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(8);

    auto* title = new QLabel(tr("<b>Parcels</b>"), panel);
    layout->addWidget(title);

    auto* openButton = new QPushButton(tr("Open GeoJSON..."), panel);
    connect(openButton, &QPushButton::clicked, this, &MainWindow::onOpenClicked);
    layout->addWidget(openButton);

    layout->addWidget(new QLabel(tr("Highlight ids (comma or space separated)"), panel));

    m_highlightEdit = new QLineEdit(panel);
    m_highlightEdit->setClearButtonEnabled(true);
    connect(m_highlightEdit, &QLineEdit::editingFinished, this, &MainWindow::onHighlightEdited);
    layout->addWidget(m_highlightEdit);

    m_onlyMatches = new QCheckBox(tr("Show only matches"), panel);
    connect(m_onlyMatches, &QCheckBox::toggled, this, &MainWindow::onOnlyMatchesToggled);
    layout->addWidget(m_onlyMatches);

    m_statusLabel = new QLabel(panel);
    layout->addWidget(m_statusLabel);

    m_infoPanel = new ParcelInfoPanel(panel);
    connect(m_infoPanel, &ParcelInfoPanel::clearRequested, this, [this]() { m_core->clearSelected(); });
    layout->addWidget(m_infoPanel);

    layout->addStretch(1);
    return panel;
}

bool MainWindow::openGeoJson(const QString& path, QString* error)
{
    GeoJsonLoader loader;
    {
        BusyCursorGuard busy;

        if (!loader.loadFile(path))
        {
            qWarning() << "MainWindow: failed to load" << path << "-" << loader.errorString();
            if (error)
                *error = loader.errorString();
            return false;
        }

        m_allFeatures = loader.takeFeatures();
        applyShownFeatures();
    }

    if (loader.skipped() > 0)
    {
        statusBar()->showMessage(tr("%1 malformed feature(s) skipped").arg(loader.skipped()), 5000);
    }

    setWindowTitle(QStringLiteral("Parcel3D - %1").arg(QFileInfo(path).fileName()));
    updateStatus();
    return true;
}

void MainWindow::setHighlightText(const QString& text)
{
    m_highlightEdit->setText(text);
    onHighlightEdited();
}

void MainWindow::onOpenClicked()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open GeoJSON"), QString(), openFilter());
    if (path.isEmpty())
        return;

    QString error;
    if (!openGeoJson(path, &error))
        QMessageBox::warning(this, tr("Open GeoJSON"), tr("Could not load %1.\n\n%2").arg(path, error));
}

void MainWindow::onHighlightEdited()
{
    HighlightSet ids = parcelinfo::parseHighlightIds(m_highlightEdit->text());
    if (ids == m_core->highlightIds())
        return;

    BusyCursorGuard busy;

    m_core->setHighlightIds(std::move(ids));
    if (m_onlyMatches->isChecked())
        applyShownFeatures();

    updateStatus();
}

void MainWindow::onOnlyMatchesToggled(bool /*checked*/)
{
    BusyCursorGuard busy;
    applyShownFeatures();
    updateStatus();
}

void MainWindow::applyShownFeatures()
{
    if (m_onlyMatches && m_onlyMatches->isChecked())
        m_core->setFeatures(parcelinfo::filterByIds(m_allFeatures, m_core->highlightIds()));
    else
        m_core->setFeatures(m_allFeatures);
}

void MainWindow::updateStatus()
{
    m_statusLabel->setText(parcelinfo::statusText(m_allFeatures.size(), m_core->highlightIds().size()));
}

void MainWindow::onUiTick()
{
    if (!m_core)
        return;

    if (m_infoPanel)
        m_infoPanel->idleEvent(m_core.get());

    const uint64_t stamp = m_core->sceneStamp();
    if (stamp == m_lastSceneStamp)
        return;

    m_lastSceneStamp = stamp;

    const SceneStats s = m_core->sceneStats();
    m_statsLabel->setText(tr("Solids: %1  Highlighted: %2  Triangles: %3")
                                 .arg(s.solids)
                                 .arg(s.highlighted)
                                 .arg(s.triangles));
}

void MainWindow::enableVulkanValidationLayer()
{
#ifndef NDEBUG
    m_vkInstance->setLayers({"VK_LAYER_KHRONOS_validation"});

    const auto supported = m_vkInstance->supportedLayers();
    if (!supported.contains("VK_LAYER_KHRONOS_validation"))
        qWarning() << "VK_LAYER_KHRONOS_validation not available on this system";
#endif
}
