#include "ImageFormatConverter.h"
#include "BatchScheduler.h"
#include "ConversionWorker.h"
#include "FileSystemTool.h"
#include "PathCatalog.h"
#include "../utils/Logger.h"

#include <chrono>

namespace Webpify
{
    std::vector<ConversionTask> ImageFormatConverter::buildTasks(const ConversionConfig& config,
                                                                 const std::vector<fs::path>& files)
    {
        ConversionTask prototype;
        prototype.inputRoot = FileSystemTool::toAbsolutePath(config.inputPath);
        prototype.outputRoot = FileSystemTool::toAbsolutePath(config.outputPath);
        prototype.quality = config.quality;
        prototype.allowedFormats = config.resolvedMimeTypes();
        prototype.skipFormats = config.resolvedSkipTypes();
        prototype.deleteOriginal = config.deleteOriginal;
        prototype.targetFormat = config.resolvedTarget();

        std::vector<ConversionTask> tasks;
        tasks.reserve(files.size());
        for (const auto& file : files) {
            ConversionTask task = prototype;
            task.sourcePath = file;
            tasks.push_back(std::move(task));
        }
        return tasks;
    }

    std::map<fs::path, std::string> ImageFormatConverter::findDestinationConflicts(
        const std::vector<ConversionTask>& tasks)
    {
        std::map<fs::path, fs::path> owners;
        std::map<fs::path, std::string> conflicts;

        for (const auto& task : tasks) {
            fs::path destination;
            try {
                destination = ConversionWorker::destinationFor(task);
            } catch (const WebpifyException&) {
                // The worker reports this task's own Error when it runs
                continue;
            }

            auto inserted = owners.emplace(destination, task.sourcePath);
            if (!inserted.second) {
                conflicts[task.sourcePath] = "destination " + destination.string() +
                                             " already produced by " + inserted.first->second.string();
            }
        }
        return conflicts;
    }

    BatchResult ImageFormatConverter::convertBatch(const ConversionConfig& config,
                                                   const ImageCodec& codec,
                                                   std::ostream& out)
    {
        config.validate();

        fs::path inputRoot = FileSystemTool::toAbsolutePath(config.inputPath);
        fs::path outputRoot = FileSystemTool::toAbsolutePath(config.outputPath);
        FormatTag target = config.resolvedTarget();

        std::error_code ec;
        if (!fs::is_directory(inputRoot, ec)) {
            throw InputNotFoundError(inputRoot);
        }

        if (!fs::exists(outputRoot, ec)) {
            Logger::info("Creating output directory: " + outputRoot.string());
            FileSystemTool::ensureDirectory(outputRoot);
        }

        Logger::info("Scanning for image files...");
        std::vector<fs::path> files = PathCatalog::scan(inputRoot, ImageFormat::canonicalExtension(target));
        std::vector<ConversionTask> tasks = buildTasks(config, files);

        BatchResult result;
        if (tasks.empty()) {
            Logger::info("No eligible image files found to convert.");
            result.report = BatchReport::fromOutcomes(result.outcomes, 0.0);
            result.report.print(out, result.outcomes);
            return result;
        }

        BatchScheduler scheduler(config.jobs);
        ConversionWorker worker(codec);

        Logger::info("Found " + std::to_string(tasks.size()) + " potential images to process.");
        Logger::info("Starting conversion with " + std::to_string(scheduler.width()) + " worker threads...");

        const std::map<fs::path, std::string> conflicts = findDestinationConflicts(tasks);
        for (const auto& conflict : conflicts) {
            Logger::warn(conflict.first.string() + ": " + conflict.second);
        }

        auto start = std::chrono::steady_clock::now();
        result.outcomes = scheduler.run(tasks, [&worker, &conflicts](const ConversionTask& task) -> TaskOutcome {
            auto conflict = conflicts.find(task.sourcePath);
            if (conflict != conflicts.end()) {
                return Error{task.sourcePath, conflict->second};
            }
            return worker.process(task);
        });
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

        result.report = BatchReport::fromOutcomes(result.outcomes, elapsed.count());
        result.report.print(out, result.outcomes);
        return result;
    }

} // namespace Webpify
