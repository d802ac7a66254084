//! @file mmc_timing.h
//! @brief Hierarchical wall-clock timers for the setup, frame and output stages.

#ifndef MMC_TIMING_H
#define MMC_TIMING_H

#include <chrono>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

//! @brief One named timer in the timing tree.
/*!
 * A timer is started and stopped once per run. Frame-stage timers run once
 * per frame, so the node keeps the total as well as the longest run.
 */
struct TIMER_NODE
{
    typedef std::chrono::steady_clock Clock;

    std::string name;
    TIMER_NODE *parent = nullptr;
    std::vector<std::unique_ptr<TIMER_NODE>> children;

    Clock::time_point started;
    bool running = false;
    std::size_t runs = 0;
    double total_seconds = 0.0;
    double longest_seconds = 0.0;

    TIMER_NODE(const std::string &timer_name, TIMER_NODE *parent_node)
        : name(timer_name), parent(parent_node) {}

    //! Seconds accumulated so far, including a run in progress.
    double elapsed() const;
};

//! @brief Process-wide registry of named timers.
/*!
 * Timer names are unique. A timer is attached to its parent the first time
 * it starts; a parent that has not been started yet, or an empty parent
 * name, attaches it at the top level.
 */
class TimingStats
{
public:
    static TimingStats &instance();

    TimingStats(const TimingStats &) = delete;
    TimingStats &operator=(const TimingStats &) = delete;

    void start_timer(const std::string &name, const std::string &parent = "");
    void stop_timer(const std::string &name);

    //! Seconds accumulated by @p name, 0 for an unknown timer.
    double elapsed(const std::string &name) const;

    //! Number of times @p name was started, 0 for an unknown timer.
    std::size_t runs(const std::string &name) const;

    //! @brief Prints the timer tree.
    /*!
     * Children of a top-level `Total Processing` timer are printed as the
     * roots of the report, followed by the total.
     */
    void print_report(std::ostream &out) const;

    //! Drops every timer.
    void reset();

private:
    TimingStats();

    TIMER_NODE *find(const std::string &name) const;
    void print_node(std::ostream &out, const TIMER_NODE &node, const std::string &indent, bool last) const;

    std::unique_ptr<TIMER_NODE> root_;
    std::map<std::string, TIMER_NODE *> by_name_;
};

//! @brief Times the enclosing scope under a named timer.
class ScopedTimer
{
public:
    ScopedTimer(const std::string &name, const std::string &parent = "");
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
    std::string name_;
};

#endif // MMC_TIMING_H
