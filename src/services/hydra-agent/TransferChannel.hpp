#pragma once

#include "OperationResult.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    virtual OperationResult Write(const char* data, size_t size) = 0;
    // Completes the file. Succeeds only once the remote side holds the
    // bytes durably; the handle is unusable afterwards.
    virtual OperationResult Flush() = 0;
};

// Authenticated session to one destination host with a file-transfer
// subchannel on top of it.
class TransferChannel {
public:
    virtual ~TransferChannel() = default;

    virtual OperationResult OpenSession(const std::string& address) = 0;
    virtual OperationResult OpenTransfer(const std::string& remoteDir) = 0;
    virtual OperationResult CreateRemoteFile(const std::string& remotePath, std::unique_ptr<RemoteFile>& outFile) = 0;
    virtual OperationResult Execute(const std::string& command) = 0;
};

using TransferChannelFactory = std::function<std::unique_ptr<TransferChannel>()>;

// Streams a local file to remotePath through an open transfer subchannel.
// No resume: a failure leaves a partial remote file behind.
OperationResult UploadFile(TransferChannel& channel, const std::string& localPath, const std::string& remotePath);
