#pragma once

#include "OperationResult.hpp"

#include <functional>
#include <string>

class ArchiveManager {
public:
    using CommandRunner = std::function<int(const std::string&)>;

    explicit ArchiveManager(CommandRunner runner = CommandRunner());

    // Packs the whole tree under dir into a gzip tarball at archivePath.
    OperationResult Compress(const std::string& dir, const std::string& archivePath) const;

    // Extracts every entry in archive order below outputDir, replacing
    // files that already exist. Not atomic: a failure leaves whatever was
    // extracted so far.
    OperationResult Decompress(const std::string& archivePath, const std::string& outputDir) const;

    static std::string BuildCompressCommand(const std::string& dir, const std::string& archivePath);
    static std::string BuildDecompressCommand(const std::string& archivePath, const std::string& outputDir);

private:
    int Run(const std::string& command) const;

    CommandRunner runner_;
};
