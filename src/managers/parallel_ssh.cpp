#include "parallel_ssh.hpp"
#include "batch_log.hpp"
#include "launch_queue.hpp"
#include "result_collector.hpp"
#include "run_set.hpp"
#include <core/time_utils.hpp>
#include <platform/fd_util.hpp>
#include <fmt/format.h>

using std::chrono::milliseconds;

// ── Construction ────────────────────────────────────────────

Result<std::unique_ptr<ParallelSSH>> ParallelSSH::create(ParallelSSHOptions options) {
    using Created = Result<std::unique_ptr<ParallelSSH>>;

    if (options.max_procs < 1) {
        return Created::Err("max_procs must be at least 1");
    }
    if (options.timeout && options.timeout->count() < 0) {
        return Created::Err("timeout must not be negative");
    }

    options.timeout = clamp_timeout(options.timeout);

    auto version = check_ssh_binary(options.ssh_bin);
    if (version.is_err()) {
        sshbatch_log("ssh check failed: " + version.error);
        return Created::Err(version.error);
    }
    sshbatch_log(fmt::format("using {} ({})", options.ssh_bin, version.value));

    return Created::Ok(std::unique_ptr<ParallelSSH>(
        new ParallelSSH(std::move(options), std::move(version.value))));
}

ParallelSSH::ParallelSSH(ParallelSSHOptions options, std::string ssh_version)
    : executor_(std::move(options.ssh_bin)),
      ssh_version_(std::move(ssh_version)),
      targets_(std::move(options.targets)),
      max_procs_(options.max_procs),
      timeout_(options.timeout) {}

// ── Settings ────────────────────────────────────────────────

void ParallelSSH::set_target_list(std::vector<std::string> targets) {
    targets_ = std::move(targets);
}

Result<void> ParallelSSH::set_max_procs(size_t max_procs) {
    if (max_procs < 1) {
        return Result<void>::Err("max_procs must be at least 1");
    }
    max_procs_ = max_procs;
    return Result<void>::Ok();
}

Result<void> ParallelSSH::set_timeout(std::optional<milliseconds> timeout) {
    if (timeout && timeout->count() < 0) {
        return Result<void>::Err("timeout must not be negative");
    }
    timeout_ = clamp_timeout(timeout);
    return Result<void>::Ok();
}

// ── Supervisor loop ─────────────────────────────────────────

int ParallelSSH::wait_slice_ms(const RunSet& running, const std::optional<milliseconds>& timeout) {
    int slice = POLL_INTERVAL_MS;
    if (timeout) {
        if (auto deadline = running.next_deadline(*timeout)) {
            auto left = std::chrono::ceil<milliseconds>(*deadline - SteadyClock::now()).count();
            if (left < slice) slice = left > 0 ? static_cast<int>(left) : 0;
        }
    }
    return slice;
}

BatchResult ParallelSSH::run(const std::string& command, int expected_exit_code,
                             const BatchEventCallback& on_event) {
    // Snapshot: setters called from here on only affect the next batch.
    const std::vector<std::string> targets = targets_;
    const size_t max_procs = max_procs_;
    const std::optional<milliseconds> timeout = timeout_;

    const auto batch_start = SteadyClock::now();
    sshbatch_log(fmt::format("batch: {} targets, max_procs={}, timeout={}, expect={}, cmd: {}",
                             targets.size(), max_procs, format_timeout(timeout),
                             expected_exit_code, command));

    LaunchQueue queue(targets);
    RunSet running(max_procs);
    ResultCollector results;

    struct Pending {
        BatchEvent::Type type;
        std::string target;
        bool failed;
    };
    std::vector<Pending> pending;

    // Events are emitted once the Run Set reflects them.
    auto flush_events = [&]() {
        if (!on_event) {
            pending.clear();
            return;
        }
        size_t failure_idx = results.failures().size();
        size_t failed_count = 0;
        for (const auto& p : pending) {
            if (p.failed) ++failed_count;
        }
        failure_idx -= failed_count;

        for (const auto& p : pending) {
            BatchEvent ev{p.type, p.target, running.size(), nullptr};
            if (p.failed) ev.failure = &results.failures()[failure_idx++];
            on_event(ev);
        }
        pending.clear();
    };

    while (true) {
        // Refill up to the ceiling
        while (!queue.empty() && running.has_capacity()) {
            RunningEntry entry;
            entry.target = queue.pop();
            entry.process = executor_.launch(entry.target, command);
            entry.started = SteadyClock::now();

            if (!entry.process.valid()) {
                results.record_launch_error(entry.target, entry.process.error());
                sshbatch_log_failure(results.failures().back());
                pending.push_back({BatchEvent::Type::Failed, entry.target, true});
                continue;
            }

            sshbatch_log(fmt::format("launch {} pid={}", entry.target, entry.process.native_handle()));
            std::string target = entry.target;
            running.add(std::move(entry));
            pending.push_back({BatchEvent::Type::Launched, std::move(target), false});
        }
        flush_events();

        if (queue.empty() && running.empty()) break;

        // Sleep until a child writes or exits (its pipes hang up), the
        // nearest deadline passes, or the poll interval runs out.
        if (platform::wait_readable(running.poll_fds(), wait_slice_ms(running, timeout)) < 0) {
            sshbatch_log("poll failed, falling back to interval sleep");
            platform::sleep_ms(POLL_INTERVAL_MS);
        }

        const auto now = SteadyClock::now();
        running.remove_if([&](RunningEntry& e) {
            e.process.drain_output();

            if (e.process.try_wait()) {
                bool ok = results.record_exit(e.target, e.process.take_output(), expected_exit_code);
                if (ok) {
                    sshbatch_log_success(results.successes().back());
                    pending.push_back({BatchEvent::Type::Succeeded, e.target, false});
                } else {
                    sshbatch_log_failure(results.failures().back());
                    pending.push_back({BatchEvent::Type::Failed, e.target, true});
                }
                return true;
            }

            if (timeout && now - e.started >= *timeout) {
                e.process.kill();
                results.record_timeout(e.target);
                sshbatch_log_failure(results.failures().back());
                pending.push_back({BatchEvent::Type::Failed, e.target, true});
                return true;
            }

            return false;
        });
        flush_events();
    }

    BatchResult result = results.take();
    result.elapsed = std::chrono::duration_cast<milliseconds>(SteadyClock::now() - batch_start);
    sshbatch_log(fmt::format("batch done in {}: {} ok, {} failed",
                             format_duration(result.elapsed),
                             result.successes.size(), result.failures.size()));

    last_ = result;
    return result;
}
