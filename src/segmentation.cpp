#include "segmentation.hpp"
#include "text_utils.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace reflow {

namespace {

// Removes the temp file on every exit path
struct TempFile {
    std::string path;
    ~TempFile() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

struct FileDescriptor {
    int fd = -1;

    explicit FileDescriptor(int value = -1) : fd(value) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void reset() {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
};

// Segmenter process; leads its own process group so the shell and anything it
// started are killed together
struct ChildProcess {
    pid_t pid = -1;

    ChildProcess() = default;
    ~ChildProcess() {
        if (pid > 0) kill_and_reap();
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void kill_and_reap() {
        kill(-pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        pid = -1;
    }
};

void write_temp_file(const std::string& text, TempFile& holder) {
    std::string pattern = (std::filesystem::temp_directory_path() / "reflow-segment-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        throw std::runtime_error("could not create temp file for segmenter input");
    }
    close(fd);
    holder.path = name.data();

    std::ofstream out(holder.path, std::ios::binary);
    out << text;
    out.close();
    if (!out) {
        throw std::runtime_error("could not write segmenter input");
    }
}

std::vector<std::string> output_lines(const std::string& output) {
    std::vector<std::string> sentences;
    std::size_t start = 0;
    while (start < output.size()) {
        std::size_t end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();

        std::string line = text::trim(output.substr(start, end - start));
        if (!line.empty()) sentences.push_back(std::move(line));
        start = end + 1;
    }
    return sentences;
}

} // namespace

std::vector<std::string> CommandSegmenter::segment(const std::string& text) {
    return run(text, nullptr);
}

std::vector<std::string> CommandSegmenter::segment_with_deadline(const std::string& text,
                                                                 std::chrono::milliseconds timeout) {
    return run(text, &timeout);
}

std::vector<std::string> CommandSegmenter::run(const std::string& text, const std::chrono::milliseconds* timeout) {
    using clock = std::chrono::steady_clock;
    const clock::time_point deadline = clock::now() + (timeout ? *timeout : std::chrono::milliseconds(0));

    TempFile input;
    write_temp_file(text, input);

    FileDescriptor in(open(input.path.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) {
        throw std::runtime_error("could not open segmenter input");
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error("could not create pipe for segmenter output");
    }
    FileDescriptor out_read(fds[0]);
    FileDescriptor out_write(fds[1]);

    const char* command = command_.c_str();

    ChildProcess child;
    const pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error("failed to start segmenter: " + command_);
    }
    if (pid == 0) {
        setpgid(0, 0);
        dup2(in.fd, STDIN_FILENO);
        dup2(out_write.fd, STDOUT_FILENO);
        execl("/bin/sh", "sh", "-c", command, static_cast<char*>(nullptr));
        _exit(127);
    }
    child.pid = pid;
    setpgid(pid, pid);  // also set here; whichever runs first wins
    out_write.reset();
    in.reset();

    auto timed_out = [&]() {
        child.kill_and_reap();
        return std::runtime_error("timed out after " + std::to_string(timeout->count()) + "ms");
    };

    std::string output;
    std::array<char, 4096> buffer;
    while (true) {
        int wait_ms = -1;
        if (timeout) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) throw timed_out();
            wait_ms = static_cast<int>(left.count());
        }

        pollfd pfd{out_read.fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("poll failed on segmenter output");
        }
        if (ready == 0) continue;

        const ssize_t n = read(out_read.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("could not read segmenter output");
        }
        if (n == 0) break;
        output.append(buffer.data(), static_cast<std::size_t>(n));
    }

    // Output closed; the shell may still be finishing
    int status = 0;
    while (true) {
        const pid_t done = waitpid(child.pid, &status, timeout ? WNOHANG : 0);
        if (done == child.pid) {
            child.pid = -1;
            break;
        }
        if (done < 0) {
            if (errno == EINTR) continue;
            child.pid = -1;
            throw std::runtime_error("lost track of segmenter process: " + command_);
        }
        if (timeout && clock::now() >= deadline) throw timed_out();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw std::runtime_error("segmenter exited with status " + std::to_string(status) + ": " + command_);
    }

    return output_lines(output);
}

FallbackSegmenter::FallbackSegmenter(std::shared_ptr<SentenceSegmenter> primary,
                                     const ReflowConfig& config,
                                     DiagnosticSink& diagnostics)
    : primary_(std::move(primary))
    , fallback_(config)
    , timeout_(config.segmenter_timeout_ms)
    , diagnostics_(diagnostics) {}

Segmentation FallbackSegmenter::segment(const std::string& text) const {
    Segmentation result;

    if (!primary_) {
        result.sentences = fallback_.split(text);
        return result;
    }

    bool ok = primary_->supports_deadline()
        ? run_primary(text, result.sentences)
        : run_primary_detached(text, result.sentences);

    if (ok && result.sentences.empty() && !text::trim(text).empty()) {
        diagnostics_.warn(primary_->name() + " returned no sentences, using rule-based splitting");
        ok = false;
    }

    if (!ok) {
        result.sentences = fallback_.split(text);
        return result;
    }

    result.external = true;
    return result;
}

bool FallbackSegmenter::run_primary(const std::string& text, std::vector<std::string>& sentences) const {
    try {
        sentences = primary_->segment_with_deadline(text, timeout_);
        return true;
    } catch (const std::exception& e) {
        diagnostics_.warn(primary_->name() + " failed (" + e.what() + "), using rule-based splitting");
    } catch (...) {
        diagnostics_.warn(primary_->name() + " failed with a non-standard exception, using rule-based splitting");
    }
    return false;
}

bool FallbackSegmenter::run_primary_detached(const std::string& text, std::vector<std::string>& sentences) const {
    // The worker owns everything it touches, so a hung segmenter can be left behind
    auto promise = std::make_shared<std::promise<std::vector<std::string>>>();
    std::future<std::vector<std::string>> future = promise->get_future();
    std::shared_ptr<SentenceSegmenter> primary = primary_;

    std::thread([primary, promise, text]() {
        try {
            promise->set_value(primary->segment(text));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        diagnostics_.warn(primary->name() + " timed out after " + std::to_string(timeout_.count()) +
                          "ms, using rule-based splitting");
        return false;
    }

    try {
        sentences = future.get();
        return true;
    } catch (const std::exception& e) {
        diagnostics_.warn(primary->name() + " failed (" + e.what() + "), using rule-based splitting");
    } catch (...) {
        diagnostics_.warn(primary->name() + " failed with a non-standard exception, using rule-based splitting");
    }
    return false;
}

} // namespace reflow
