#include "PipelineTimingSource.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <utility>

namespace KUCHIPAKU {

    namespace {

        void ReplaceAll(std::string* s, const std::string& from, const std::string& to) {
            size_t pos = 0;
            while ((pos = s->find(from, pos)) != std::string::npos) {
                s->replace(pos, from.size(), to);
                pos += to.size();
            }
        }

    }  // namespace

    PipelineTimingSource::PipelineTimingSource(const std::string& command_template,
        const std::string& work_dir)
        : command_template_(command_template),
        work_dir_(work_dir.empty() ? "." : work_dir) {
    }

    PipelineTimingSource::~PipelineTimingSource() {
        for (Job& job : jobs_) {
            if (job.pid > 0) {
                kill(job.pid, SIGTERM);
                waitpid(job.pid, nullptr, 0);
            }
            if (job.fd >= 0) {
                close(job.fd);
            }
            std::remove(job.text_file.c_str());
        }
    }

    std::string PipelineTimingSource::BuildCommand(const std::string& command_template,
        int speaker_id, const std::string& text_file) {
        std::string command = command_template;
        ReplaceAll(&command, "{speaker}", std::to_string(speaker_id));
        ReplaceAll(&command, "{text_file}", "'" + text_file + "'");
        return command;
    }

    void PipelineTimingSource::Request(const TimingRequest& request, TimingCallback callback) {
        Job job;
        job.callback = std::move(callback);
        job.text_file = work_dir_ + "/timing_request_" + std::to_string(getpid()) + "_" +
            std::to_string(next_request_id_++) + ".txt";

        {
            std::ofstream text_out(job.text_file);
            if (!text_out) {
                std::cerr << "Failed to write timing request text: " << job.text_file << "\n";
                failed_.push_back(std::move(job.callback));
                return;
            }
            text_out << request.text;
        }

        int fds[2];
        if (pipe(fds) != 0) {
            std::cerr << "pipe() failed: " << std::strerror(errno) << "\n";
            std::remove(job.text_file.c_str());
            failed_.push_back(std::move(job.callback));
            return;
        }

        std::string command = BuildCommand(command_template_, request.speaker_id, job.text_file);
        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "fork() failed: " << std::strerror(errno) << "\n";
            close(fds[0]);
            close(fds[1]);
            std::remove(job.text_file.c_str());
            failed_.push_back(std::move(job.callback));
            return;
        }
        if (pid == 0) {
            dup2(fds[1], STDOUT_FILENO);
            close(fds[0]);
            close(fds[1]);
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        close(fds[1]);
        int flags = fcntl(fds[0], F_GETFL);
        if (flags < 0 || fcntl(fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
            // Still correct, but Poll() may stall on this helper's output.
            std::cerr << "Timing helper pipe stays blocking: " << std::strerror(errno) << "\n";
        }
        job.pid = pid;
        job.fd = fds[0];
        jobs_.push_back(std::move(job));
    }

    bool PipelineTimingSource::PumpJob(Job& job, bool* ok) {
        char buffer[4096];
        while (!job.eof) {
            ssize_t n = read(job.fd, buffer, sizeof(buffer));
            if (n > 0) {
                job.output.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                job.eof = true;
                close(job.fd);
                job.fd = -1;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "Timing helper read failed: " << std::strerror(errno) << "\n";
                job.eof = true;
                close(job.fd);
                job.fd = -1;
            }
            break;
        }
        if (!job.eof) {
            return false;
        }

        int status = 0;
        pid_t reaped = waitpid(job.pid, &status, WNOHANG);
        if (reaped == 0) {
            return false;
        }
        job.pid = -1;
        *ok = reaped > 0 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
        if (!*ok) {
            std::cerr << "Timing helper exited abnormally\n";
        }
        return true;
    }

    void PipelineTimingSource::Poll() {
        std::vector<std::pair<TimingCallback, TimingData>> completed;
        std::vector<bool> completed_ok;

        for (TimingCallback& callback : failed_) {
            completed.emplace_back(std::move(callback), TimingData());
            completed_ok.push_back(false);
        }
        failed_.clear();

        for (size_t i = 0; i < jobs_.size();) {
            bool ok = false;
            if (!PumpJob(jobs_[i], &ok)) {
                ++i;
                continue;
            }

            TimingData data;
            if (ok && !ParseTimingDataText(jobs_[i].output, &data)) {
                std::cerr << "Timing helper printed invalid JSON\n";
                ok = false;
            }
            std::remove(jobs_[i].text_file.c_str());
            completed.emplace_back(std::move(jobs_[i].callback), std::move(data));
            completed_ok.push_back(ok);
            jobs_.erase(jobs_.begin() + static_cast<std::ptrdiff_t>(i));
        }

        // Callbacks may issue new requests.
        for (size_t i = 0; i < completed.size(); ++i) {
            if (completed[i].first) {
                completed[i].first(completed_ok[i] && !completed[i].second.empty(),
                    completed[i].second);
            }
        }
    }

}  // namespace KUCHIPAKU
