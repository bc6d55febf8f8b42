//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Content-Length framed JSON-RPC over stdin/stdout with a poll-driven reader and a writer queue
//==========================================================================================================

#include "hostmcp/StdioTransport.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#ifdef _WIN32
#  include <io.h>
#else
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

#include "hostmcp/ContentFramer.h"
#include "hostmcp/MessageProcessor.h"
#include "logging/Logger.h"

namespace hostmcp {

namespace {
constexpr int kPollIntervalMs = 200;
constexpr std::size_t kReadChunk = 4096;
constexpr auto kDrainTimeout = std::chrono::seconds(5);
} // namespace

class StdioTransport::Impl : public std::enable_shared_from_this<StdioTransport::Impl> {
public:
    std::shared_ptr<MessageProcessor> processor;
    std::unique_ptr<IContentFramer> framer;
    int inFd;
    int outFd;

    std::atomic<bool> running{false};
    std::mutex stopMutex;
    std::atomic<bool> closedFired{false};
    std::mutex handlerMutex;
    ITransport::ErrorHandler errorHandler;
    ITransport::ClosedHandler closedHandler;

    std::thread readerThread;
    std::thread writerThread;
#ifndef _WIN32
    int wakePipe[2]{-1, -1};
#endif

    std::mutex writeMutex;
    std::condition_variable writeCv;
    std::deque<std::string> writeQueue;
    bool writerStop{false};

    std::mutex inFlightMutex;
    std::condition_variable inFlightCv;
    int inFlight{0};

    Impl(std::shared_ptr<MessageProcessor> proc, std::size_t maxContentLength, int in, int out)
        : processor(std::move(proc)), framer(MakeContentLengthFramer(maxContentLength)), inFd(in), outFd(out) {}

    ~Impl() {
#ifndef _WIN32
        closeWakePipe();
#endif
    }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    void fireClosed() {
        if (closedFired.exchange(true)) {
            return;
        }
        ITransport::ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = closedHandler;
        }
        if (handler) {
            handler();
        }
    }

#ifndef _WIN32
    void openWakePipe() {
        if (::pipe(wakePipe) != 0) {
            throw std::runtime_error(std::string("StdioTransport: pipe() failed: ") + ::strerror(errno));
        }
        for (int fd : wakePipe) {
            int fl = ::fcntl(fd, F_GETFL, 0);
            if (fl >= 0) {
                (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
            }
            // Not inherited by execute_command children
            if (::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
                LOG_WARN("StdioTransport: FD_CLOEXEC on wake pipe failed: {}", ::strerror(errno));
            }
        }
    }

    void closeWakePipe() {
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
    }

    void wake() {
        if (wakePipe[1] < 0) {
            return;
        }
        const char b = 1;
        ssize_t wr;
        do {
            wr = ::write(wakePipe[1], &b, 1);
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }
#endif

    //==========================================================================================================
    // Queues a reply for the writer thread. Replies produced after Stop() are dropped.
    //==========================================================================================================
    void enqueue(const std::string& payload) {
        std::string frame = framer->encode(payload);
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (writerStop) {
                LOG_DEBUG("StdioTransport: dropping reply after stop ({} bytes)", payload.size());
                return;
            }
            writeQueue.push_back(std::move(frame));
        }
        writeCv.notify_one();
    }

    bool writeAll(const std::string& data) {
        std::size_t off = 0;
        while (off < data.size()) {
#ifdef _WIN32
            int n = ::_write(outFd, data.data() + off, static_cast<unsigned int>(data.size() - off));
#else
            ssize_t n = ::write(outFd, data.data() + off, data.size() - off);
#endif
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
#ifndef _WIN32
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd{outFd, POLLOUT, 0};
                    (void)::poll(&pfd, 1, kPollIntervalMs);
                    continue;
                }
#endif
                LOG_ERROR("StdioTransport: write failed (errno={} msg={})", errno, ::strerror(errno));
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    void writerLoop() {
        FUNC_SCOPE();
        while (true) {
            std::string frame;
            {
                std::unique_lock<std::mutex> lk(writeMutex);
                writeCv.wait(lk, [this]{ return writerStop || !writeQueue.empty(); });
                if (writeQueue.empty()) {
                    break;
                }
                frame = std::move(writeQueue.front());
                writeQueue.pop_front();
            }
            if (!writeAll(frame)) {
                reportError("StdioTransport: write failed");
                std::lock_guard<std::mutex> lk(writeMutex);
                writerStop = true;
                writeQueue.clear();
                break;
            }
        }
    }

    //==========================================================================================================
    // Dispatches one decoded message on a worker so the reader keeps consuming input while a tool runs.
    //==========================================================================================================
    void dispatch(std::string message) {
        {
            std::lock_guard<std::mutex> lk(inFlightMutex);
            ++inFlight;
        }
        auto self = shared_from_this();
        std::thread([self, message = std::move(message)]() {
            try {
                auto reply = self->processor->HandleMessage(message, StdioTransport::kClientId);
                if (reply) {
                    self->enqueue(*reply);
                }
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: message handling failed: {}", e.what());
            }
            {
                std::lock_guard<std::mutex> lk(self->inFlightMutex);
                --self->inFlight;
            }
            self->inFlightCv.notify_all();
        }).detach();
    }

    //==========================================================================================================
    // Drains every complete frame from the buffer. Oversized bodies are skipped across reads.
    //==========================================================================================================
    void drainFrames(std::string& buffer, std::size_t& discardRemaining) {
        while (running.load()) {
            if (discardRemaining > 0) {
                const std::size_t n = std::min(discardRemaining, buffer.size());
                buffer.erase(0, n);
                discardRemaining -= n;
                if (discardRemaining > 0) {
                    return;
                }
            }
            auto r = framer->tryDecodeEx(buffer);
            switch (r.status) {
            case IContentFramer::DecodeStatus::Incomplete:
                return;
            case IContentFramer::DecodeStatus::Ok:
                buffer.erase(0, r.bytesConsumed);
                dispatch(std::move(*r.payload));
                break;
            case IContentFramer::DecodeStatus::InvalidHeader:
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
                reportError("StdioTransport: invalid frame header");
                break;
            case IContentFramer::DecodeStatus::BodyTooLarge:
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
                discardRemaining = r.bodyToDiscard;
                reportError("StdioTransport: body too large");
                break;
            }
        }
    }

    void waitForInFlight() {
        std::unique_lock<std::mutex> lk(inFlightMutex);
        if (!inFlightCv.wait_for(lk, kDrainTimeout, [this]{ return inFlight == 0; })) {
            LOG_WARN("StdioTransport: {} request(s) still running at shutdown", inFlight);
        }
    }

    void readerLoop() {
        FUNC_SCOPE();
        std::string buffer;
        std::size_t discardRemaining = 0;
        std::vector<char> tmp(kReadChunk);
        bool eof = false;

        while (running.load()) {
#ifdef _WIN32
            int n = ::_read(inFd, tmp.data(), static_cast<unsigned int>(tmp.size()));
#else
            struct pollfd pfds[2];
            pfds[0].fd = inFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int rc = ::poll(pfds, 2, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: poll failed");
                break;
            }
            if (rc == 0) {
                continue;
            }
            if (pfds[1].revents & POLLIN) {
                break;
            }
            if (pfds[0].revents & POLLNVAL) {
                LOG_ERROR("StdioTransport: input descriptor {} is invalid", inFd);
                reportError("StdioTransport: invalid input descriptor");
                break;
            }
            // POLLHUP still leaves buffered data to read; read() returns 0 once drained.
            ssize_t n = ::read(inFd, tmp.data(), tmp.size());
#endif
            if (n > 0) {
                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                drainFrames(buffer, discardRemaining);
            } else if (n == 0) {
                LOG_INFO("StdioTransport: EOF on input");
                eof = true;
                break;
            } else {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: read error");
                break;
            }
        }

        if (!buffer.empty()) {
            LOG_DEBUG("StdioTransport: discarding {} buffered bytes of a partial frame", buffer.size());
        }
        if (eof && running.load()) {
            // Let outstanding requests answer before the transport reports closure.
            waitForInFlight();
            running.store(false);
            fireClosed();
        }
    }
};

StdioTransport::StdioTransport(std::shared_ptr<MessageProcessor> processor,
                               std::size_t maxContentLength,
                               int inputFd,
                               int outputFd)
    : pImpl(std::make_shared<Impl>(std::move(processor), maxContentLength, inputFd, outputFd)) {}

StdioTransport::~StdioTransport() {
    try {
        Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("StdioTransport: stop during destruction failed: {}", e.what());
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.exchange(true)) {
        ready.set_exception(std::make_exception_ptr(std::runtime_error("StdioTransport already running")));
        return fut;
    }
    try {
#ifndef _WIN32
        pImpl->openWakePipe();
#endif
        {
            std::lock_guard<std::mutex> lk(pImpl->writeMutex);
            pImpl->writerStop = false;
        }
        pImpl->closedFired.store(false);
        pImpl->writerThread = std::thread([impl = pImpl]() { impl->writerLoop(); });
        pImpl->readerThread = std::thread([impl = pImpl]() { impl->readerLoop(); });
        LOG_INFO("StdioTransport started (in fd={}, out fd={})", pImpl->inFd, pImpl->outFd);
        ready.set_value();
    } catch (const std::exception& e) {
        LOG_ERROR("StdioTransport start failed: {}", e.what());
        pImpl->running.store(false);
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    auto impl = pImpl;
    std::lock_guard<std::mutex> stopLock(impl->stopMutex);
    if (!impl->readerThread.joinable() && !impl->writerThread.joinable()) {
        impl->running.store(false);
        done.set_value();
        return fut;
    }

    impl->running.store(false);
#ifndef _WIN32
    impl->wake();
#endif
    if (impl->readerThread.joinable()) {
        if (impl->readerThread.get_id() == std::this_thread::get_id()) {
            impl->readerThread.detach();
        } else {
#ifdef _WIN32
            // A blocking _read cannot be interrupted; the thread owns a reference to the state.
            impl->readerThread.detach();
#else
            impl->readerThread.join();
#endif
        }
    }

    impl->waitForInFlight();
    {
        std::lock_guard<std::mutex> lk(impl->writeMutex);
        impl->writerStop = true;
    }
    impl->writeCv.notify_all();
    if (impl->writerThread.joinable()) {
        if (impl->writerThread.get_id() == std::this_thread::get_id()) {
            impl->writerThread.detach();
        } else {
            impl->writerThread.join();
        }
    }
#ifndef _WIN32
    impl->closeWakePipe();
#endif
    impl->fireClosed();
    done.set_value();
    return fut;
}

bool StdioTransport::IsRunning() const {
    return pImpl->running.load();
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void StdioTransport::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closedHandler = std::move(handler);
}

} // namespace hostmcp
