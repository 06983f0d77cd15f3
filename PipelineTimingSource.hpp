#ifndef PIPELINE_TIMING_SOURCE_H_
#define PIPELINE_TIMING_SOURCE_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "TimingSource.hpp"

namespace KUCHIPAKU {

    // Fetches timing data by running an external helper (for example a script
    // that posts the line to the speech engine's audio_query endpoint) and
    // parsing the JSON it prints on stdout.
    //
    // The command is run through /bin/sh after substituting
    //   {speaker}    the speaker id,
    //   {text_file}  a file holding the line's UTF-8 text.
    // The child's output is drained without blocking from Poll(). A child that
    // never exits simply never completes; it is killed on destruction.
    class PipelineTimingSource : public TimingSource {
    public:
        PipelineTimingSource(const std::string& command_template, const std::string& work_dir);
        ~PipelineTimingSource() override;

        PipelineTimingSource(const PipelineTimingSource&) = delete;
        PipelineTimingSource& operator=(const PipelineTimingSource&) = delete;

        void Request(const TimingRequest& request, TimingCallback callback) override;
        void Poll() override;
        size_t GetPendingCount() const override { return jobs_.size() + failed_.size(); }

        // Substitutes the placeholders; exposed for tests.
        static std::string BuildCommand(const std::string& command_template, int speaker_id,
            const std::string& text_file);

    private:
        struct Job {
            pid_t pid = -1;
            int fd = -1;
            bool eof = false;
            std::string output;
            std::string text_file;
            TimingCallback callback;
        };

        // Reads what is available; returns true once the child is reaped.
        bool PumpJob(Job& job, bool* ok);

        std::string command_template_;
        std::string work_dir_;
        unsigned long next_request_id_ = 0;
        std::vector<Job> jobs_;
        std::vector<TimingCallback> failed_;
    };

}  // namespace KUCHIPAKU

#endif
