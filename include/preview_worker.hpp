#pragma once

#include "entry.hpp"
#include "errors.hpp"
#include "preview.hpp"
#include "preview_payload.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace quickswitch {

struct PreviewJobResult {
    std::uint64_t generation{0};
    std::filesystem::path path;
    PreviewPayload payload;
    std::optional<Error> error;
};

// Runs at most one preview job at a time on a dedicated thread. Submitting a new job
// supersedes the previous one: a job that has not started is dropped, a running job
// sees its cancel check flip and its result is thrown away.
class PreviewWorker {
public:
    using PreviewFunction = std::function<PreviewPayload(const Entry &, Error *, const CancelCheck &)>;
    using Notify = std::function<void()>;

    explicit PreviewWorker(PreviewFunction function, Notify notify = {});
    ~PreviewWorker();

    PreviewWorker(const PreviewWorker &) = delete;
    PreviewWorker &operator=(const PreviewWorker &) = delete;

    // Waits for a notify call already in progress, so the old callback is never
    // running once this returns. The same holds for cancel().
    void set_notify(Notify notify);
    void submit(std::uint64_t generation, Entry entry);
    void cancel();

    // Result of the most recent submission, once it has finished.
    std::optional<PreviewJobResult> take_result();

    bool idle() const;

private:
    struct Job {
        std::uint64_t generation{0};
        Entry entry;
    };

    void worker_loop();

    PreviewFunction function_;
    Notify notify_;

    mutable std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable notify_done_cv_;
    std::optional<Job> pending_;
    std::optional<PreviewJobResult> result_;
    bool job_running_{false};
    bool notifying_{false};
    bool stop_requested_{false};
    std::atomic<std::uint64_t> active_generation_{0};

    std::thread thread_;
};

}
