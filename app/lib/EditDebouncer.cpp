#include "EditDebouncer.hpp"
#include "Logger.hpp"

#include <utility>


EditDebouncer::EditDebouncer(std::function<void()> on_commit,
                             std::chrono::milliseconds quiet_period)
    : on_commit(std::move(on_commit)),
      quiet_period_(quiet_period)
{
    timer.setSingleShot(true);
    timer.setInterval(static_cast<int>(quiet_period_.count()));
    QObject::connect(&timer, &QTimer::timeout, [this]() { commit(); });
}


void EditDebouncer::note_edit()
{
    timer.start();
}


void EditDebouncer::flush()
{
    if (!timer.isActive()) {
        return;
    }
    timer.stop();
    commit();
}


void EditDebouncer::cancel()
{
    timer.stop();
}


bool EditDebouncer::has_pending() const
{
    return timer.isActive();
}


void EditDebouncer::commit()
{
    if (auto logger = Logger::get_logger("ui_logger")) {
        logger->debug("Committing debounced description edit");
    }
    if (on_commit) {
        on_commit();
    }
}
