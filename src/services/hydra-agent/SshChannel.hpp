#pragma once

#include "AgentConfig.hpp"
#include "TransferChannel.hpp"

#include <functional>
#include <string>

// TransferChannel driven by the OpenSSH client. Remote files are streamed
// through a pipe into `cat` on the destination.
class SshChannel : public TransferChannel {
public:
    using CommandRunner = std::function<int(const std::string&)>;

    explicit SshChannel(SshSettings settings, CommandRunner runner = CommandRunner());

    OperationResult OpenSession(const std::string& address) override;
    OperationResult OpenTransfer(const std::string& remoteDir) override;
    OperationResult CreateRemoteFile(const std::string& remotePath, std::unique_ptr<RemoteFile>& outFile) override;
    OperationResult Execute(const std::string& command) override;

    static std::string BuildSshPrefix(const SshSettings& settings, const std::string& address);
    static std::string BuildRemoteCommand(
        const SshSettings& settings,
        const std::string& address,
        const std::string& remoteCommand);
    static std::string BuildMakeDirectoryCommand(const std::string& remoteDir);
    static std::string BuildWriteFileCommand(const std::string& remotePath);

private:
    int Run(const std::string& command) const;

    SshSettings settings_;
    CommandRunner runner_;
    std::string address_;
    bool sessionOpen_ = false;
    bool transferOpen_ = false;
};
