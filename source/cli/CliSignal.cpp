#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#endif

namespace Cli {

namespace {

std::atomic<bool> s_interrupted(false);
std::atomic<bool> s_noticeShown(false);

#ifdef Q_OS_WIN

BOOL WINAPI onConsoleEvent(DWORD event)
{
    if (event == CTRL_C_EVENT || event == CTRL_BREAK_EVENT) {
        s_interrupted = true;
        return TRUE;
    }
    // Closing the console or logging off still terminates the process
    return FALSE;
}

#else

void onSignal(int)
{
    s_interrupted = true;
}

#endif

} // namespace

void installSignalHandlers()
{
#ifdef Q_OS_WIN
    SetConsoleCtrlHandler(onConsoleEvent, TRUE);
#else
    struct sigaction action;
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // interrupted syscalls return EINTR
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

std::atomic<bool>* getCancellationFlag()
{
    return &s_interrupted;
}

bool wasCancelled()
{
    if (!s_interrupted.load()) {
        return false;
    }
    if (!s_noticeShown.exchange(true)) {
        // stderr keeps --json output on stdout parseable
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI",
            "Interrupted. Remaining files were skipped.") << "\n";
        err.flush();
    }
    return true;
}

void resetCancellation()
{
    s_interrupted = false;
    s_noticeShown = false;
}

} // namespace Cli
