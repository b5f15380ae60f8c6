#include "SshChannel.hpp"

#include "ShellQuote.hpp"
#include "Tracing.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

#include <sys/wait.h>

namespace {
constexpr int kConnectTimeoutSeconds = 10;

bool ExitedCleanly(int status) {
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

class SshRemoteFile : public RemoteFile {
public:
    SshRemoteFile(FILE* pipe, std::string remotePath)
        : pipe_(pipe),
          remotePath_(std::move(remotePath)) {}

    ~SshRemoteFile() override {
        if (pipe_ != nullptr) {
            pclose(pipe_);
        }
    }

    SshRemoteFile(const SshRemoteFile&) = delete;
    SshRemoteFile& operator=(const SshRemoteFile&) = delete;

    OperationResult Write(const char* data, size_t size) override {
        if (pipe_ == nullptr) {
            return OperationResult::Failure(ErrorKind::Transfer, remotePath_ + " is already closed");
        }

        if (std::fwrite(data, 1, size, pipe_) != size) {
            return OperationResult::Failure(ErrorKind::Transfer, "write to " + remotePath_ + " failed");
        }
        return OperationResult::Success();
    }

    OperationResult Flush() override {
        if (pipe_ == nullptr) {
            return OperationResult::Failure(ErrorKind::Transfer, remotePath_ + " is already closed");
        }

        const bool flushed = std::fflush(pipe_) == 0;
        const int status = pclose(pipe_);
        pipe_ = nullptr;

        if (!flushed || !ExitedCleanly(status)) {
            std::cerr << "[Transfer] Remote write of " << remotePath_ << " did not complete" << std::endl;
            return OperationResult::Failure(ErrorKind::Transfer, "remote write of " + remotePath_ + " failed");
        }
        return OperationResult::Success();
    }

private:
    FILE* pipe_;
    std::string remotePath_;
};
} // namespace

SshChannel::SshChannel(SshSettings settings, CommandRunner runner)
    : settings_(std::move(settings)),
      runner_(std::move(runner)) {}

OperationResult SshChannel::OpenSession(const std::string& address) {
    if (address.empty()) {
        return OperationResult::Failure(ErrorKind::Transfer, "destination address is empty");
    }
    if (BuildSshPrefix(settings_, address).empty()) {
        return OperationResult::Failure(ErrorKind::Transfer, "destination address is not usable: " + address);
    }

    auto span = Tracer::Instance().StartSpan("transfer.session.open");
    Tracer::Instance().SetAttribute(span, "net.peer.name", address);

    const int status = Run(BuildRemoteCommand(settings_, address, "true"));
    Tracer::Instance().EndSpan(span, status == 0);

    if (status != 0) {
        std::cerr << "[Transfer] ssh session to " << address << " failed (status " << status << ")" << std::endl;
        return OperationResult::Failure(ErrorKind::Transfer, "cannot open ssh session to " + address);
    }

    address_ = address;
    sessionOpen_ = true;
    transferOpen_ = false;
    return OperationResult::Success();
}

OperationResult SshChannel::OpenTransfer(const std::string& remoteDir) {
    if (!sessionOpen_) {
        return OperationResult::Failure(ErrorKind::Transfer, "no session open");
    }

    const int status = Run(BuildRemoteCommand(settings_, address_, BuildMakeDirectoryCommand(remoteDir)));
    if (status != 0) {
        return OperationResult::Failure(
            ErrorKind::Transfer, "cannot prepare " + remoteDir + " on " + address_);
    }

    transferOpen_ = true;
    return OperationResult::Success();
}

OperationResult SshChannel::CreateRemoteFile(const std::string& remotePath, std::unique_ptr<RemoteFile>& outFile) {
    outFile.reset();
    if (!transferOpen_) {
        return OperationResult::Failure(ErrorKind::Transfer, "no transfer subchannel open");
    }

    const std::string command = BuildRemoteCommand(settings_, address_, BuildWriteFileCommand(remotePath));
    FILE* pipe = popen(command.c_str(), "w");
    if (pipe == nullptr) {
        return OperationResult::Failure(ErrorKind::Transfer, "cannot start ssh for " + remotePath);
    }

    outFile = std::make_unique<SshRemoteFile>(pipe, remotePath);
    return OperationResult::Success();
}

OperationResult SshChannel::Execute(const std::string& command) {
    if (!sessionOpen_) {
        return OperationResult::Failure(ErrorKind::Transfer, "no session open");
    }

    auto span = Tracer::Instance().StartSpan("transfer.remote.exec");
    Tracer::Instance().SetAttribute(span, "net.peer.name", address_);

    const int status = Run(BuildRemoteCommand(settings_, address_, command));
    Tracer::Instance().EndSpan(span, status == 0);

    if (status != 0) {
        return OperationResult::Failure(
            ErrorKind::Transfer, "remote command on " + address_ + " exited with status " + std::to_string(status));
    }
    return OperationResult::Success();
}

std::string SshChannel::BuildSshPrefix(const SshSettings& settings, const std::string& address) {
    // ssh would read a leading '-' in the target as an option.
    if (address.empty() || address.front() == '-' || (!settings.user.empty() && settings.user.front() == '-')) {
        return {};
    }

    std::ostringstream command;
    command << "ssh -T -o BatchMode=yes -o ConnectTimeout=" << kConnectTimeoutSeconds;
    if (settings.port > 0 && settings.port != 22) {
        command << " -p " << settings.port;
    }
    if (!settings.identityPath.empty()) {
        command << " -i " << ShellQuote(settings.identityPath);
    }

    const std::string target = settings.user.empty() ? address : settings.user + "@" + address;
    command << " " << ShellQuote(target);
    return command.str();
}

std::string SshChannel::BuildRemoteCommand(
    const SshSettings& settings,
    const std::string& address,
    const std::string& remoteCommand) {
    const std::string prefix = BuildSshPrefix(settings, address);
    if (prefix.empty() || remoteCommand.empty()) {
        return {};
    }
    return prefix + " " + ShellQuote(remoteCommand);
}

std::string SshChannel::BuildMakeDirectoryCommand(const std::string& remoteDir) {
    return "mkdir -p " + ShellQuote(remoteDir);
}

std::string SshChannel::BuildWriteFileCommand(const std::string& remotePath) {
    return "cat > " + ShellQuote(remotePath) + " && sync";
}

int SshChannel::Run(const std::string& command) const {
    if (command.empty()) {
        return -1;
    }

    if (runner_) {
        return runner_(command);
    }

    return std::system(command.c_str());
}
