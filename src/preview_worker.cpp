#include "preview_worker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace quickswitch {

PreviewWorker::PreviewWorker(PreviewFunction function, Notify notify)
    : function_(std::move(function)), notify_(std::move(notify)) {
    thread_ = std::thread([this] { worker_loop(); });
}

PreviewWorker::~PreviewWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        pending_.reset();
        active_generation_ = 0;
    }
    job_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PreviewWorker::set_notify(Notify notify) {
    std::unique_lock<std::mutex> lock(mutex_);
    notify_done_cv_.wait(lock, [this] { return !notifying_; });
    notify_ = std::move(notify);
}

void PreviewWorker::submit(std::uint64_t generation, Entry entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_generation_ = generation;
        pending_ = Job{generation, std::move(entry)};
        result_.reset();
    }
    job_cv_.notify_one();
}

void PreviewWorker::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    notify_done_cv_.wait(lock, [this] { return !notifying_; });
    active_generation_ = 0;
    pending_.reset();
    result_.reset();
}

std::optional<PreviewJobResult> PreviewWorker::take_result() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!result_ || result_->generation != active_generation_.load()) {
        return std::nullopt;
    }
    std::optional<PreviewJobResult> result = std::move(result_);
    result_.reset();
    return result;
}

bool PreviewWorker::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_ && !job_running_;
}

void PreviewWorker::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_cv_.wait(lock, [this] { return stop_requested_ || pending_.has_value(); });
            if (stop_requested_) {
                return;
            }
            job = std::move(*pending_);
            pending_.reset();
            job_running_ = true;
        }

        const std::uint64_t generation = job.generation;
        const CancelCheck cancelled = [this, generation] {
            return active_generation_.load() != generation;
        };

        Error error;
        PreviewPayload payload;
        try {
            payload = function_(job.entry, &error, cancelled);
        } catch (const std::exception &e) {
            error = Error{ErrorKind::IoFailure, std::string("Preview failed: ") + e.what()};
            payload = BinaryInfo{job.entry.size};
        }
        const bool failed = !error.message.empty();

        Notify notify;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            job_running_ = false;
            if (active_generation_.load() != generation) {
                spdlog::debug("Discarding superseded preview of {}", job.entry.path.string());
                continue;
            }
            PreviewJobResult result;
            result.generation = generation;
            result.path = job.entry.path;
            result.payload = std::move(payload);
            if (failed) {
                result.error = error;
            }
            result_ = std::move(result);
            notify = notify_;
            notifying_ = static_cast<bool>(notify);
        }
        if (notify) {
            notify();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                notifying_ = false;
            }
            notify_done_cv_.notify_all();
        }
    }
}

}
