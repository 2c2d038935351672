#include "BatchReport.h"

#include <iomanip>
#include <sstream>

namespace Webpify
{
    namespace
    {
        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    }

    BatchReport BatchReport::fromOutcomes(const std::vector<TaskOutcome>& outcomes,
                                          std::optional<double> elapsedSeconds)
    {
        BatchReport report;
        report.total = outcomes.size();
        report.elapsedSeconds = elapsedSeconds;

        for (const auto& outcome : outcomes)
        {
            std::visit(overloaded{
                [&](const Converted&) { report.converted++; },
                [&](const Skipped&)   { report.skipped++; },
                [&](const Error&)     { report.errors++; },
            }, outcome);
        }
        return report;
    }

    double BatchReport::throughput() const
    {
        if (!elapsedSeconds || *elapsedSeconds <= 0.0) return 0.0;
        return static_cast<double>(converted) / *elapsedSeconds;
    }

    std::string BatchReport::describe(const TaskOutcome& outcome)
    {
        return std::visit(overloaded{
            [](const Converted& c) {
                std::string line = "Converted " + c.source.string() + " to " + c.destination.string();
                if (!c.note.empty()) line += " | " + c.note;
                return line;
            },
            [](const Skipped& s) {
                std::string reason = toString(s.reason);
                if (!s.format.empty() && s.reason != SkipReason::AlreadyTargetFormat) {
                    reason += " " + s.format;
                }
                return "Skipped (" + reason + "): " + s.source.string();
            },
            [](const Error& e) {
                return "Error processing " + e.source.string() + ": " + e.message;
            },
        }, outcome);
    }

    void BatchReport::print(std::ostream& out, const std::vector<TaskOutcome>& outcomes) const
    {
        out << "\n--- Conversion Summary ---\n";
        for (const auto& outcome : outcomes) {
            out << describe(outcome) << "\n";
        }
        printTotals(out);
    }

    void BatchReport::printTotals(std::ostream& out) const
    {
        out << "---\n";
        out << "Total tasks: " << total << "\n";
        out << "Successfully converted: " << converted << "\n";
        out << "Skipped: " << skipped << "\n";
        out << "Errors: " << errors << "\n";
        if (elapsedSeconds) {
            std::ostringstream timing;
            timing << std::fixed << std::setprecision(2)
                   << "Elapsed: " << *elapsedSeconds << " s\n"
                   << "Throughput: " << throughput() << " images/s\n";
            out << timing.str();
        }
        out << "Conversion process finished." << std::endl;
    }

} // namespace Webpify
