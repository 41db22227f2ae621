#include "jswitch/env_store.hpp"
#include "jswitch/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace jswitch {

namespace {

class Fd {
public:
    explicit Fd(int fd = -1) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { Close(); }

    int Get() const { return fd_; }

    int Close() {
        int rc = 0;
        if (fd_ >= 0) rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

Result FailErrno(int err, const std::string& what) {
    return Result::Fail(KindForErrno(err), err, what + ": " + std::strerror(err));
}

// Splits "KEY=value" (optionally prefixed with "export "). Returns false for
// comments, blank lines and anything without '='.
bool ParseLine(std::string_view line, std::string_view& key, std::string_view& value) {
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) line.remove_prefix(1);
    if (line.empty() || line.front() == '#') return false;
    if (line.rfind("export ", 0) == 0) line.remove_prefix(7);

    const size_t eq = line.find('=');
    if (eq == std::string_view::npos || eq == 0) return false;

    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    if (!value.empty() && value.back() == '\r') value.remove_suffix(1);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return true;
}

Result ReadLines(const std::string& path, std::vector<std::string>& lines) {
    lines.clear();
    errno = 0;
    std::ifstream in(path);
    if (!in.is_open()) {
        const int err = errno ? errno : EIO;
        if (err == ENOENT) return Result::Ok();
        return FailErrno(err, "Cannot read " + path);
    }
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return Result::Ok();
}

Result WriteAll(int fd, const std::string& data, const std::string& path) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return FailErrno(errno, "Write failed: " + path);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

// pam_env has no escape syntax, so a quote or line break cannot be stored.
Result CheckStorableValue(const std::string& name, const std::string& value) {
    if (value.find_first_of("\"\r\n") == std::string::npos) return Result::Ok();
    return Result::Fail(ErrorKind::EnvironmentStoreError,
                        "Value for " + name + " contains a quote or line break");
}

Result CheckMachineScope(EnvScope scope, const std::string& path) {
    if (scope == EnvScope::Machine) return Result::Ok();
    return Result::Fail(ErrorKind::EnvironmentStoreError,
                        std::string("Environment file ") + path + " only holds machine scope, not " +
                            ToString(scope));
}

} // namespace

ErrorKind KindForErrno(int err) {
    return (err == EACCES || err == EPERM || err == EROFS)
        ? ErrorKind::EnvironmentWritePermissionDenied
        : ErrorKind::EnvironmentStoreError;
}

EnvironmentFileStore::EnvironmentFileStore(std::string path) : path_(std::move(path)) {}

void EnvironmentFileStore::FallbackToProcess(const std::string& name) {
    process_fallback_.insert(name);
}

Result EnvironmentFileStore::GetVariable(EnvScope scope, const std::string& name,
                                         std::optional<std::string>& value) {
    if (auto r = CheckMachineScope(scope, path_); !r.ok) return r;

    std::vector<std::string> lines;
    if (auto r = ReadLines(path_, lines); !r.ok) return r;

    value.reset();
    for (const auto& line : lines) {
        std::string_view k, v;
        if (ParseLine(line, k, v) && k == name) value = std::string(v);
    }

    if (!value && process_fallback_.count(name)) {
        if (const char* env = std::getenv(name.c_str())) {
            LogDebug("%s not set in %s, using process value", name.c_str(), path_.c_str());
            value = env;
        }
    }
    return Result::Ok();
}

Result EnvironmentFileStore::SetVariable(EnvScope scope, const std::string& name, const std::string& value) {
    if (auto r = CheckMachineScope(scope, path_); !r.ok) return r;
    if (auto r = CheckStorableValue(name, value); !r.ok) return r;
    return Rewrite(name, value);
}

Result EnvironmentFileStore::UnsetVariable(EnvScope scope, const std::string& name) {
    if (auto r = CheckMachineScope(scope, path_); !r.ok) return r;
    return Rewrite(name, std::nullopt);
}

Result EnvironmentFileStore::Rewrite(const std::string& name, const std::optional<std::string>& value) {
    std::vector<std::string> lines;
    if (auto r = ReadLines(path_, lines); !r.ok) return r;

    const std::string replacement = value ? name + "=\"" + *value + "\"" : std::string();
    std::string content;
    bool written = false;
    for (const auto& line : lines) {
        std::string_view k, v;
        if (ParseLine(line, k, v) && k == name) {
            // First occurrence is replaced in place, later duplicates are dropped.
            if (value && !written) {
                content += replacement;
                content += '\n';
            }
            written = true;
            continue;
        }
        content += line;
        content += '\n';
    }
    if (value && !written) {
        content += replacement;
        content += '\n';
    }

    mode_t mode = 0644;
    struct stat st {};
    if (::stat(path_.c_str(), &st) == 0) mode = st.st_mode & 07777;

    const std::string tmp_path = path_ + ".jswitch.tmp";
    Fd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
    if (fd.Get() < 0) return FailErrno(errno, "Cannot create " + tmp_path);

    auto res = WriteAll(fd.Get(), content, tmp_path);
    if (res.ok && ::fsync(fd.Get()) != 0) res = FailErrno(errno, "fsync failed: " + tmp_path);
    if (fd.Close() != 0 && res.ok) res = FailErrno(errno, "close failed: " + tmp_path);
    if (!res.ok) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return FailErrno(err, "Atomic rename to " + path_ + " failed");
    }

    LogDebug("%s %s in %s", value ? "Set" : "Removed", name.c_str(), path_.c_str());
    return Result::Ok();
}

std::unique_ptr<IEnvironmentStore> MakeSystemEnvironmentStore(const std::string& env_file,
                                                              const std::string& path_variable) {
    auto store = std::make_unique<EnvironmentFileStore>(env_file.empty() ? kDefaultEnvironmentFile : env_file);
    store->FallbackToProcess(path_variable);
    return store;
}

} // namespace jswitch
