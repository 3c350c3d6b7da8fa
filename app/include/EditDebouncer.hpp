#ifndef EDIT_DEBOUNCER_HPP
#define EDIT_DEBOUNCER_HPP

#include <QTimer>

#include <chrono>
#include <functional>

/**
 * @brief Commits a burst of description edits once typing pauses.
 *
 * Each note_edit() restarts the quiet period. The commit callback runs on
 * the Qt event loop when the period elapses without another edit.
 */
class EditDebouncer
{
public:
    static constexpr std::chrono::milliseconds kDefaultQuietPeriod{1000};

    explicit EditDebouncer(std::function<void()> on_commit,
                           std::chrono::milliseconds quiet_period = kDefaultQuietPeriod);

    EditDebouncer(const EditDebouncer&) = delete;
    EditDebouncer& operator=(const EditDebouncer&) = delete;

    void note_edit();
    // Commits a pending edit now; no-op when nothing is pending.
    void flush();
    void cancel();
    bool has_pending() const;

    std::chrono::milliseconds quiet_period() const { return quiet_period_; }

private:
    void commit();

    std::function<void()> on_commit;
    std::chrono::milliseconds quiet_period_;
    QTimer timer;
};

#endif
