// transfer_engine.cpp - sequential plan execution with partial-failure semantics

#include "arkv/transfer_engine.hpp"
#include "arkv/log.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace arkv
{

    namespace
    {

        // ============================================================================
        // chunked local reader, optionally one chunk ahead on a worker
        // ============================================================================

        class chunk_reader
        {
        public:
            chunk_reader(std::istream &in, std::size_t const chunk_size, bool const read_ahead)
                : in_{in}, current_(chunk_size), spare_(chunk_size), read_ahead_{read_ahead}
            {
            }

            ~chunk_reader()
            {
                if (pending_.valid())
                {
                    pending_.wait();
                }
            }

            chunk_reader(chunk_reader const &) = delete;
            auto operator=(chunk_reader const &) -> chunk_reader & = delete;

            // empty span at end of file
            [[nodiscard]] auto next() -> result<std::span<std::byte const>>
            {
                if (!read_ahead_)
                {
                    auto const n = fill(current_);
                    if (!n.has_value())
                    {
                        return std::unexpected{n.error()};
                    }
                    return std::span<std::byte const>{current_.data(), *n};
                }

                auto const n = pending_.valid() ? pending_.get() : fill(spare_);
                if (!n.has_value())
                {
                    return std::unexpected{n.error()};
                }

                // spare_ holds the fresh chunk; the caller is done with current_
                std::swap(current_, spare_);
                if (*n > 0)
                {
                    pending_ = std::async(std::launch::async, [this] { return fill(spare_); });
                }
                return std::span<std::byte const>{current_.data(), *n};
            }

        private:
            [[nodiscard]] auto fill(std::vector<std::byte> &buffer) -> result<std::size_t>
            {
                in_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (in_.bad())
                {
                    return std::unexpected{error_code::local_io_error};
                }
                return static_cast<std::size_t>(in_.gcount());
            }

            std::istream &in_;
            std::vector<std::byte> current_;
            std::vector<std::byte> spare_;
            bool read_ahead_{false};
            std::future<result<std::size_t>> pending_;
        };

        // ============================================================================
        // one execute() call
        // ============================================================================

        class plan_run
        {
        public:
            plan_run(engine_options const &options, session_manager &sessions, upload_plan const &plan,
                     progress_sink &sink, cancel_token const *cancel)
                : options_{options}, sessions_{sessions}, plan_{plan}, sink_{sink}, cancel_{cancel},
                  outcomes_(plan.size()), reported_(plan.size(), 0)
            {
            }

            [[nodiscard]] auto run() -> upload_summary
            {
                auto const started_at = std::chrono::steady_clock::now();

                if (!sessions_.has_session())
                {
                    session_dead_ = true;
                }

                std::size_t index = 0;
                for (; index < plan_.size(); ++index)
                {
                    if (cancelled())
                    {
                        log::get()->info("upload cancelled before entry {} of {}", index, plan_.size());
                        break;
                    }
                    if (session_dead_)
                    {
                        break;
                    }
                    run_entry(index);
                }

                // whatever was not attempted
                for (; index < plan_.size(); ++index)
                {
                    if (session_dead_)
                    {
                        record(index, entry_outcome::failed(error_code::session_lost));
                    }
                    else
                    {
                        record(index, entry_outcome::skipped(skip_reason::cancelled));
                    }
                }

                summary_.elapsed = std::chrono::steady_clock::now() - started_at;
                if (session_dead_)
                {
                    summary_.aborted_by = error_code::session_lost;
                }

                summary_.outcomes.reserve(outcomes_.size());
                for (auto const &outcome : outcomes_)
                {
                    summary_.outcomes.push_back(outcome.value_or(entry_outcome::failed(error_code::session_lost)));
                }
                return std::move(summary_);
            }

        private:
            struct attempt
            {
                entry_outcome outcome;
                std::uint64_t bytes{0};
            };

            [[nodiscard]] auto cancelled() const noexcept -> bool
            {
                return cancel_ != nullptr && cancel_->requested();
            }

            [[nodiscard]] auto transport() -> sftp_transport & { return sessions_.current().transport(); }

            void emit(transfer_event const &event) { sink_.on_event(event); }

            void run_entry(std::size_t const index)
            {
                auto const &entry = plan_.entries[index];

                if (entry.kind == entry_kind::symlink)
                {
                    record(index, entry_outcome::skipped(skip_reason::symlink_not_followed));
                    return;
                }

                auto outcome = attempt_entry(index, false);
                if (outcome.outcome.is_failure() && is_session_level(outcome.outcome.error))
                {
                    // the entry gets one more go on a fresh session
                    if (!recover())
                    {
                        record(index, entry_outcome::failed(error_code::session_lost));
                        return;
                    }
                    outcome = attempt_entry(index, true);
                    if (outcome.outcome.is_failure() && is_session_level(outcome.outcome.error))
                    {
                        session_dead_ = true;
                        record(index, entry_outcome::failed(error_code::session_lost));
                        return;
                    }
                }

                record(index, outcome.outcome, outcome.bytes);
                track_remote_failures(entry, outcome.outcome);
            }

            [[nodiscard]] auto attempt_entry(std::size_t const index, bool const retry) -> attempt
            {
                auto const &entry = plan_.entries[index];
                if (entry.is_directory())
                {
                    return ensure_directory(entry);
                }
                return transfer_file(index, retry);
            }

            [[nodiscard]] auto ensure_directory(upload_entry const &entry) -> attempt
            {
                auto const remote = plan_.absolute_remote_path(entry);
                if (auto ensured = materializer_.ensure(transport(), remote); !ensured.has_value())
                {
                    log::get()->warn("could not ensure remote directory {}: {}", remote, ensured.error());
                    return attempt{entry_outcome::failed(ensured.error())};
                }
                emit(events::directory_ensured{remote});
                return attempt{entry_outcome::success()};
            }

            [[nodiscard]] auto transfer_file(std::size_t const index, bool const retry) -> attempt
            {
                auto const &entry = plan_.entries[index];
                auto const remote = plan_.absolute_remote_path(entry);

                if (!retry)
                {
                    emit(events::started{index, &entry});
                }

                // single-file plans carry no directory entry for remote_base
                auto const parent = remote_path::parent(remote);
                if (!materializer_.is_known(parent))
                {
                    if (auto ensured = materializer_.ensure(transport(), parent); !ensured.has_value())
                    {
                        return attempt{entry_outcome::failed(ensured.error())};
                    }
                    emit(events::directory_ensured{parent});
                }

                std::ifstream local{entry.local_path, std::ios::binary};
                if (!local)
                {
                    log::get()->warn("cannot read {}", entry.local_path.string());
                    return attempt{entry_outcome::failed(error_code::local_io_error)};
                }

                auto opened = transport().open_write(remote, constants::remote_file_mode);
                if (!opened.has_value())
                {
                    auto const error = classify_open_failure(remote, opened.error());
                    log::get()->warn("cannot open remote {}: {}", remote, error);
                    return attempt{entry_outcome::failed(error)};
                }
                auto &file = **opened;

                chunk_reader reader{local, options_.chunk_size, options_.read_ahead};
                std::uint64_t written_total = 0;
                while (true)
                {
                    auto chunk = reader.next();
                    if (!chunk.has_value())
                    {
                        log::get()->warn("read error on {}", entry.local_path.string());
                        return attempt{entry_outcome::failed(chunk.error())};
                    }
                    if (chunk->empty())
                    {
                        break;
                    }

                    auto pending = *chunk;
                    while (!pending.empty())
                    {
                        auto sent = file.write(pending);
                        if (!sent.has_value())
                        {
                            log::get()->warn("write to {} failed: {}", remote, sent.error());
                            return attempt{entry_outcome::failed(sent.error())};
                        }
                        if (*sent == 0)
                        {
                            return attempt{entry_outcome::failed(error_code::remote_io_error)};
                        }
                        pending = pending.subspan(std::min(*sent, pending.size()));
                        written_total += *sent;
                    }

                    report_bytes(index, entry, written_total);

                    // mid-file cancellation leaves the partial remote file in place
                    if (cancelled())
                    {
                        if (auto closed = file.close(); !closed.has_value())
                        {
                            log::get()->debug("closing {} after cancel failed: {}", remote, closed.error());
                        }
                        return attempt{entry_outcome::skipped(skip_reason::cancelled), written_total};
                    }
                }

                if (auto closed = file.close(); !closed.has_value())
                {
                    return attempt{entry_outcome::failed(closed.error())};
                }

                log::get()->debug("uploaded {} -> {} ({} bytes)", entry.local_path.string(), remote, written_total);
                return attempt{entry_outcome::success(), written_total};
            }

            // servers refuse to open a directory with a generic failure
            [[nodiscard]] auto classify_open_failure(std::string const &remote, error_code const error) -> error_code
            {
                if (is_session_level(error))
                {
                    return error;
                }
                auto const kind = transport().stat(remote);
                if (kind.has_value() && kind->has_value() && **kind != remote_kind::regular)
                {
                    return error_code::path_conflict;
                }
                return error;
            }

            // a retried file reports only bytes past what the sink has already seen
            void report_bytes(std::size_t const index, upload_entry const &entry, std::uint64_t const written_total)
            {
                auto &reported = reported_[index];
                if (written_total > reported)
                {
                    emit(events::bytes_written{index, &entry, written_total - reported});
                    reported = written_total;
                }
            }

            [[nodiscard]] auto recover() -> bool
            {
                remote_failure_streak_ = 0;
                if (!sessions_.can_reconnect())
                {
                    session_dead_ = true;
                    return false;
                }
                if (auto again = sessions_.reconnect(); !again.has_value())
                {
                    session_dead_ = true;
                    return false;
                }
                return true;
            }

            // repeated remote write refusals usually mean the channel is gone
            void track_remote_failures(upload_entry const &entry, entry_outcome const &outcome)
            {
                if (!entry.is_file())
                {
                    return;
                }
                if (!outcome.is_failure() || outcome.error != error_code::remote_io_error)
                {
                    remote_failure_streak_ = 0;
                    return;
                }
                if (++remote_failure_streak_ >= constants::remote_failure_streak_limit)
                {
                    log::get()->warn("{} consecutive remote write failures, treating the session as lost",
                                     remote_failure_streak_);
                    if (!recover())
                    {
                        log::get()->error("session declared lost");
                    }
                }
            }

            void record(std::size_t const index, entry_outcome const outcome, std::uint64_t const bytes = 0)
            {
                auto &slot = outcomes_[index];
                if (slot.has_value())
                {
                    return;
                }
                slot = outcome;

                auto const &entry = plan_.entries[index];
                switch (outcome.state)
                {
                case entry_outcome::status::succeeded:
                    if (entry.is_directory())
                    {
                        ++summary_.directories_ensured;
                    }
                    else
                    {
                        ++summary_.files_transferred;
                        summary_.bytes_transferred += bytes;
                    }
                    break;
                case entry_outcome::status::skipped:
                    ++summary_.skipped;
                    break;
                case entry_outcome::status::failed:
                    ++summary_.failed;
                    break;
                }

                emit(events::entry_completed{index, &entry, outcome});
            }

            engine_options const &options_;
            session_manager &sessions_;
            upload_plan const &plan_;
            progress_sink &sink_;
            cancel_token const *cancel_;

            directory_materializer materializer_;
            std::vector<std::optional<entry_outcome>> outcomes_;
            std::vector<std::uint64_t> reported_;
            upload_summary summary_{};
            std::size_t remote_failure_streak_{0};
            bool session_dead_{false};
        };

    } // namespace

    transfer_engine::transfer_engine(engine_options options) : options_{options}
    {
        options_.chunk_size = std::clamp(options_.chunk_size, constants::min_chunk_size, constants::max_chunk_size);
    }

    auto transfer_engine::execute(session_manager &sessions,
                                  upload_plan const &plan,
                                  progress_sink &sink,
                                  cancel_token const *cancel) -> upload_summary
    {
        log::get()->debug("executing plan: {} directories, {} files, {} bytes", plan.total_directories,
                          plan.total_files, plan.total_bytes);
        return plan_run{options_, sessions, plan, sink, cancel}.run();
    }

} // namespace arkv
