#include "core/mmc_timing.h"

#include <algorithm>
#include <iomanip>

namespace
{

const char *const TOTAL_TIMER = "Total Processing";

double seconds_since(TIMER_NODE::Clock::time_point t)
{
    return std::chrono::duration<double>(TIMER_NODE::Clock::now() - t).count();
}

} // namespace

double TIMER_NODE::elapsed() const
{
    return running ? total_seconds + seconds_since(started) : total_seconds;
}

TimingStats::TimingStats()
{
    reset();
}

TimingStats &TimingStats::instance()
{
    static TimingStats stats;
    return stats;
}

TIMER_NODE *TimingStats::find(const std::string &name) const
{
    auto it = by_name_.find(name);
    return (it == by_name_.end()) ? nullptr : it->second;
}

void TimingStats::start_timer(const std::string &name, const std::string &parent)
{
    TIMER_NODE *node = find(name);
    if (node == nullptr)
    {
        TIMER_NODE *owner = parent.empty() ? nullptr : find(parent);
        if (owner == nullptr)
            owner = root_.get();
        owner->children.push_back(std::make_unique<TIMER_NODE>(name, owner));
        node = owner->children.back().get();
        by_name_[name] = node;
    }

    if (node->running)
        return;
    node->running = true;
    node->started = TIMER_NODE::Clock::now();
    ++node->runs;
}

void TimingStats::stop_timer(const std::string &name)
{
    TIMER_NODE *node = find(name);
    if (node == nullptr || !node->running)
        return;

    const double run = seconds_since(node->started);
    node->total_seconds += run;
    node->longest_seconds = std::max(node->longest_seconds, run);
    node->running = false;
}

double TimingStats::elapsed(const std::string &name) const
{
    const TIMER_NODE *node = find(name);
    return (node == nullptr) ? 0.0 : node->elapsed();
}

std::size_t TimingStats::runs(const std::string &name) const
{
    const TIMER_NODE *node = find(name);
    return (node == nullptr) ? 0 : node->runs;
}

void TimingStats::print_node(std::ostream &out, const TIMER_NODE &node,
                             const std::string &indent, bool last) const
{
    out << "[TIMING] " << indent << (last ? "└─ " : "├─ ") << node.name << ": "
        << node.elapsed() << " s";
    if (node.runs > 1)
    {
        out << " over " << node.runs << " runs (mean "
            << node.elapsed() / static_cast<double>(node.runs)
            << " s, max " << node.longest_seconds << " s)";
    }
    out << "\n";

    const std::string child_indent = indent + (last ? "   " : "│  ");
    for (std::size_t i = 0; i < node.children.size(); ++i)
        print_node(out, *node.children[i], child_indent, i + 1 == node.children.size());
}

void TimingStats::print_report(std::ostream &out) const
{
    const TIMER_NODE *total = find(TOTAL_TIMER);
    const TIMER_NODE &top = (total != nullptr) ? *total : *root_;

    double total_seconds = 0.0;
    if (total != nullptr)
    {
        total_seconds = total->elapsed();
    }
    else
    {
        for (const auto &child : root_->children)
            total_seconds += child->elapsed();
    }

    const std::ios::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    out << std::fixed << std::setprecision(4);

    out << "\n====Execution Timing Stats====\n";
    for (std::size_t i = 0; i < top.children.size(); ++i)
        print_node(out, *top.children[i], "", i + 1 == top.children.size());
    out << "==============================\n";
    out << "Total Processing Time: " << total_seconds << " seconds\n";
    out << "==============================\n";

    out.flags(flags);
    out.precision(precision);
}

void TimingStats::reset()
{
    by_name_.clear();
    root_ = std::make_unique<TIMER_NODE>("ROOT", nullptr);
}

ScopedTimer::ScopedTimer(const std::string &name, const std::string &parent)
    : name_(name)
{
    TimingStats::instance().start_timer(name_, parent);
}

ScopedTimer::~ScopedTimer()
{
    TimingStats::instance().stop_timer(name_);
}
