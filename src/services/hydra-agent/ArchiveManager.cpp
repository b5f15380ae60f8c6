#include "ArchiveManager.hpp"

#include "ShellQuote.hpp"
#include "Tracing.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

ArchiveManager::ArchiveManager(CommandRunner runner)
    : runner_(std::move(runner)) {}

OperationResult ArchiveManager::Compress(const std::string& dir, const std::string& archivePath) const {
    if (dir.empty() || archivePath.empty()) {
        return OperationResult::Failure(ErrorKind::Archive, "archive source and target must be set");
    }

    std::error_code error;
    if (!std::filesystem::is_directory(dir, error)) {
        return OperationResult::Failure(ErrorKind::Archive, "source directory not found: " + dir);
    }

    const std::filesystem::path target(archivePath);
    if (!target.parent_path().empty()) {
        std::filesystem::create_directories(target.parent_path(), error);
        if (error) {
            return OperationResult::Failure(
                ErrorKind::Archive, "cannot create " + target.parent_path().string() + ": " + error.message());
        }
    }

    auto span = Tracer::Instance().StartSpan("archive.compress");
    Tracer::Instance().SetAttribute(span, "archive.source", dir);
    Tracer::Instance().SetAttribute(span, "archive.path", archivePath);

    const int exitCode = Run(BuildCompressCommand(dir, archivePath));
    Tracer::Instance().SetAttribute(span, "process.exit_code", static_cast<int64_t>(exitCode));
    Tracer::Instance().EndSpan(span, exitCode == 0);

    if (exitCode != 0) {
        std::cerr << "[Archive] tar exited with " << exitCode << " while packing " << dir << std::endl;
        return OperationResult::Failure(ErrorKind::Archive, "packing " + dir + " failed");
    }

    return OperationResult::Success();
}

OperationResult ArchiveManager::Decompress(const std::string& archivePath, const std::string& outputDir) const {
    if (archivePath.empty() || outputDir.empty()) {
        return OperationResult::Failure(ErrorKind::Archive, "archive path and destination must be set");
    }

    std::error_code error;
    if (!std::filesystem::is_regular_file(archivePath, error)) {
        return OperationResult::Failure(ErrorKind::Archive, "archive not found: " + archivePath);
    }

    std::filesystem::create_directories(outputDir, error);
    if (error) {
        return OperationResult::Failure(
            ErrorKind::Archive, "cannot create " + outputDir + ": " + error.message());
    }

    auto span = Tracer::Instance().StartSpan("archive.decompress");
    Tracer::Instance().SetAttribute(span, "archive.path", archivePath);
    Tracer::Instance().SetAttribute(span, "archive.destination", outputDir);

    std::cout << "[Archive] Extracting " << archivePath << " into " << outputDir << std::endl;
    const int exitCode = Run(BuildDecompressCommand(archivePath, outputDir));
    Tracer::Instance().SetAttribute(span, "process.exit_code", static_cast<int64_t>(exitCode));
    Tracer::Instance().EndSpan(span, exitCode == 0);

    if (exitCode != 0) {
        std::cerr << "[Archive] tar exited with " << exitCode << " while extracting " << archivePath << std::endl;
        return OperationResult::Failure(ErrorKind::Archive, "extracting " + archivePath + " failed");
    }

    return OperationResult::Success();
}

std::string ArchiveManager::BuildCompressCommand(const std::string& dir, const std::string& archivePath) {
    if (dir.empty() || archivePath.empty()) {
        return {};
    }

    std::ostringstream command;
    command << "tar -czf " << ShellQuote(archivePath) << " -C " << ShellQuote(dir) << " .";
    return command.str();
}

std::string ArchiveManager::BuildDecompressCommand(const std::string& archivePath, const std::string& outputDir) {
    if (archivePath.empty() || outputDir.empty()) {
        return {};
    }

    std::ostringstream command;
    command << "tar -xzf " << ShellQuote(archivePath) << " -C " << ShellQuote(outputDir) << " --overwrite";
    return command.str();
}

int ArchiveManager::Run(const std::string& command) const {
    if (command.empty()) {
        return -1;
    }

    if (runner_) {
        return runner_(command);
    }

    return std::system(command.c_str());
}
