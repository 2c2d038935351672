#include "ConversionWorker.h"
#include "EligibilityFilter.h"
#include "FileSystemTool.h"
#include "../utils/Logger.h"

namespace Webpify
{
    ConversionWorker::ConversionWorker(const ImageCodec& codec)
        : m_codec(codec)
    {
    }

    fs::path ConversionWorker::destinationFor(const ConversionTask& task)
    {
        return FileSystemTool::rebase(task.sourcePath, task.inputRoot, task.outputRoot,
                                      ImageFormat::canonicalExtension(task.targetFormat));
    }

    TaskOutcome ConversionWorker::process(const ConversionTask& task) const
    {
        try {
            return convert(task);
        } catch (const std::exception& e) {
            return Error{task.sourcePath, e.what()};
        } catch (...) {
            return Error{task.sourcePath, "unknown exception"};
        }
    }

    TaskOutcome ConversionWorker::convert(const ConversionTask& task) const
    {
        ByteBuffer bytes = FileSystemTool::readFile(task.sourcePath);

        // Header probe first so excluded files never pay for a full decode
        std::optional<FormatTag> format = m_codec.probe(bytes);
        if (auto reason = EligibilityFilter::classify(format, task)) {
            Logger::debug("Skipped (" + std::string(toString(*reason)) + "): " + task.sourcePath.string());
            return Skipped{task.sourcePath, *reason, format.value_or("")};
        }

        std::optional<ImageDescriptor> image = m_codec.decode(bytes);
        if (!image) {
            Logger::debug("Skipped (undecodable " + *format + "): " + task.sourcePath.string());
            return Skipped{task.sourcePath, SkipReason::UnknownFormat, *format};
        }
        bytes.clear();
        bytes.shrink_to_fit();

        fs::path destination = destinationFor(task);
        FileSystemTool::ensureDirectoryForFile(destination);

        ByteBuffer encoded = m_codec.encode(*image, task.targetFormat, task.quality);
        FileSystemTool::writeFile(destination, encoded);

        Converted converted{task.sourcePath, destination, ""};
        if (task.deleteOriginal) {
            std::string reason;
            if (FileDeleter::deleteFile(task.sourcePath, reason)) {
                converted.note = "Deleted original " + task.sourcePath.string();
            } else {
                converted.note = "FAILED to delete original " + task.sourcePath.string() + ": " + reason;
                Logger::warn("Could not delete '" + task.sourcePath.string() + "': " + reason);
            }
        }

        Logger::debug("Converted '" + task.sourcePath.filename().string() + "' to '" + destination.filename().string() + "'.");
        return converted;
    }

} // namespace Webpify
