#include "TransferChannel.hpp"

#include "Tracing.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace {
constexpr size_t kChunkSize = 64 * 1024;
} // namespace

OperationResult UploadFile(TransferChannel& channel, const std::string& localPath, const std::string& remotePath) {
    std::error_code error;
    const auto size = std::filesystem::file_size(localPath, error);
    if (error) {
        return OperationResult::Failure(ErrorKind::Transfer, "cannot stat " + localPath + ": " + error.message());
    }

    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return OperationResult::Failure(ErrorKind::Transfer, "unable to open " + localPath);
    }

    auto span = Tracer::Instance().StartSpan("transfer.upload");
    Tracer::Instance().SetAttribute(span, "transfer.local_path", localPath);
    Tracer::Instance().SetAttribute(span, "transfer.remote_path", remotePath);
    Tracer::Instance().SetAttribute(span, "transfer.bytes", static_cast<int64_t>(size));

    std::unique_ptr<RemoteFile> remoteFile;
    OperationResult result = channel.CreateRemoteFile(remotePath, remoteFile);
    if (!result) {
        Tracer::Instance().EndSpan(span, result);
        return result;
    }

    std::vector<char> buffer(kChunkSize);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = input.gcount();
        if (count <= 0) {
            break;
        }

        result = remoteFile->Write(buffer.data(), static_cast<size_t>(count));
        if (!result) {
            Tracer::Instance().EndSpan(span, result);
            return result;
        }
    }

    if (input.bad()) {
        Tracer::Instance().EndSpan(span, false);
        return OperationResult::Failure(ErrorKind::Transfer, "read error on " + localPath);
    }

    result = remoteFile->Flush();
    Tracer::Instance().EndSpan(span, result);
    if (result) {
        std::cout << "[Transfer] Uploaded " << size << " bytes to " << remotePath << std::endl;
    }
    return result;
}
