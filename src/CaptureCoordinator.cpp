#include "CaptureCoordinator.h"
#include "session/CaptureSession.h"
#include "settings/OverlaySessionSettingsManager.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>
#include <exception>

namespace SnapOverlay {

CaptureCoordinator::CaptureCoordinator(IOverlayWindowFactory *windowFactory, QObject *parent)
    : QObject(parent)
    , m_windowFactory(windowFactory)
{
}

CaptureCoordinator::~CaptureCoordinator()
{
    if (m_session) {
        m_tearingDown = true;
        m_session->dispose();
        delete m_session;
    }
}

bool CaptureCoordinator::isActive() const
{
    return m_session && !m_session->isClosed();
}

bool CaptureCoordinator::startCapture(const QList<ScreenInfo> &screens)
{
    if (isActive()) {
        qDebug() << "CaptureCoordinator: Already in capture mode, ignoring";
        return false;
    }
    if (screens.isEmpty()) {
        qWarning() << "CaptureCoordinator: No screens to capture";
        return false;
    }

    qDebug() << "CaptureCoordinator: Starting region capture on" << screens.size() << "screen(s)";

    // A session torn down from one of its own signals may still be pending deletion
    if (m_session) {
        m_session->dispose();
        m_session->deleteLater();
        m_session = nullptr;
    }

    m_tearingDown = false;
    m_pendingSelection.reset();
    m_session = new CaptureSession(m_windowFactory, this);

    connect(m_session, &CaptureSession::regionSelected,
            this, &CaptureCoordinator::onRegionSelected);
    connect(m_session, &CaptureSession::cancelled,
            this, &CaptureCoordinator::onSelectionCancelled);
    connect(m_session, &CaptureSession::closed,
            this, &CaptureCoordinator::onSessionClosed);

    try {
        buildWindows(screens);
    } catch (const std::exception &e) {
        qWarning() << "CaptureCoordinator: Failed to create overlay windows:" << e.what();
        teardownSession();
        return false;
    }

    emit captureStarted();
    m_session->showAll();
    return true;
}

bool CaptureCoordinator::confirmCapture()
{
    if (!isActive() || !m_pendingSelection) {
        qDebug() << "CaptureCoordinator: Nothing to confirm";
        return false;
    }

    const RegionSelection selection = *m_pendingSelection;
    qDebug() << "CaptureCoordinator: Capture confirmed" << selection.rect;
    teardownSession();
    emit captureCompleted(selection);
    return true;
}

void CaptureCoordinator::cancelCapture()
{
    if (!isActive()) {
        return;
    }

    qDebug() << "CaptureCoordinator: Capture cancelled by host";
    teardownSession();
    emit captureCancelled();
}

void CaptureCoordinator::onRegionSelected(IOverlayWindow *source, const RegionSelection &selection)
{
    Q_UNUSED(source);

    if (selection.isEditable) {
        qDebug() << "CaptureCoordinator: Editable region selected, entering annotation" << selection.rect;
        m_pendingSelection = selection;
        emit annotationStarted(selection);
        return;
    }

    qDebug() << "CaptureCoordinator: Region selected" << selection.rect;
    teardownSession();
    emit captureCompleted(selection);
}

void CaptureCoordinator::onSelectionCancelled(IOverlayWindow *source, const QString &reason)
{
    Q_UNUSED(source);

    qDebug() << "CaptureCoordinator: Selection cancelled:" << reason;
    teardownSession();
    emit captureCancelled();
}

void CaptureCoordinator::onSessionClosed()
{
    if (m_tearingDown) {
        return;
    }

    // An overlay went away on its own (user or OS closed it)
    qDebug() << "CaptureCoordinator: Session closed externally, treating as cancel";
    teardownSession();
    emit captureCancelled();
}

void CaptureCoordinator::buildWindows(const QList<ScreenInfo> &screens)
{
    const auto &settings = OverlaySessionSettingsManager::instance();
    const bool elementDetection = settings.isElementDetectionEnabled();
    const Qt::Key modifierKey = settings.loadElementPickModifier();

    if (settings.loadWindowLayout() == OverlaySessionSettingsManager::WindowLayout::SpanVirtualDesktop) {
        const QRect bounds = CoordinateHelper::virtualDesktopBounds(screens);
        m_session->createWindowBuilder()
            .withBounds(bounds)
            .withScreens(screens)
            .enableElementDetection(elementDetection)
            .withModifierKey(modifierKey)
            .build();
        return;
    }

    for (const ScreenInfo &screen : screens) {
        m_session->createWindowBuilder()
            .withBounds(screen.geometry)
            .withScreens(CoordinateHelper::screensIntersecting(screens, screen.geometry))
            .enableElementDetection(elementDetection)
            .withModifierKey(modifierKey)
            .build();
    }
}

void CaptureCoordinator::teardownSession()
{
    if (!m_session || m_tearingDown) {
        return;
    }

    m_tearingDown = true;
    m_pendingSelection.reset();

    // May run inside one of the session's own signals
    CaptureSession *session = m_session;
    m_session = nullptr;
    session->dispose();
    session->deleteLater();
}

} // namespace SnapOverlay
