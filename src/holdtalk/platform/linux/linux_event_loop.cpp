#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_injector.hpp"
#include "transcription/http_backend.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, uint16_t key_code, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_(config_.audio.ring_capacity_samples()),
      audio_capture_(ring_, config_.audio),
      hotkey_source_(config_.hotkey.device),
      hotkey_(hotkey_source_, key_code),
      core_(config_, verbose_, ring_, audio_capture_,
            std::make_unique<HttpBackend>(config_.backend),
            std::make_unique<WaylandInjector>(
                config_.output.method == "paste" ? WaylandInjector::Mode::Paste
                                                 : WaylandInjector::Mode::Type,
                config_.output.terminal_paste),
            // NotifyCallback, runs on the worker thread
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

Result<void> LinuxEventLoop::init() {
    auto opened = hotkey_.open();
    if (!opened) return opened;
    log("Watching " + hotkey_source_.device_path());

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return make_error(ErrorKind::Input,
                          std::format("epoll_create1 failed: {}", std::strerror(errno)));
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    // A helper that exits before reading its stdin must surface as EPIPE
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        return make_error(ErrorKind::Input,
                          std::format("signalfd failed: {}", std::strerror(errno)));
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        return make_error(ErrorKind::Input,
                          std::format("eventfd failed: {}", std::strerror(errno)));
    }

    for (int fd : {signal_fd_, worker_event_fd_, hotkey_.event_fd()}) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            return make_error(ErrorKind::Input,
                              std::format("epoll_ctl failed: {}", std::strerror(errno)));
        }
    }

    running_.store(true, std::memory_order_release);
    return {};
}

Result<void> LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];
    Result<void> outcome;

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            outcome = make_error(ErrorKind::Input,
                                 std::format("epoll_wait error: {}", std::strerror(errno)));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_transcription_complete();
                }
                continue;
            }

            if (fd == hotkey_.event_fd()) {
                auto transitions = hotkey_.poll();
                if (!transitions) {
                    outcome = std::unexpected(transitions.error());
                    running_.store(false, std::memory_order_release);
                    break;
                }
                for (auto t : *transitions) {
                    core_.on_hotkey(t);
                }
            }
        }
    }

    core_.shutdown();
    return outcome;
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdtalk] {}", msg);
    }
}
