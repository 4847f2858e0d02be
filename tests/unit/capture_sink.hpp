/**
 * @file capture_sink.hpp
 * @brief In-memory log sink shared by the unit and integration tests.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace crew_orchestrator::testing {

/// Lines written to any sink created by make_sink() land in the same buffer.
class CapturedLines {
public:
    class Sink : public ILogSink {
    public:
        explicit Sink(std::shared_ptr<CapturedLines> lines) : lines_(std::move(lines)) {}
        void write(std::string_view json_line) override { lines_->push(json_line); }
        void flush() override { ++lines_->flushes_; }

    private:
        std::shared_ptr<CapturedLines> lines_;
    };

    static std::unique_ptr<ILogSink> make_sink(const std::shared_ptr<CapturedLines>& lines) {
        return std::make_unique<Sink>(lines);
    }

    void push(std::string_view line) {
        std::lock_guard lock(mutex_);
        lines_.emplace_back(line);
    }

    std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    size_t count_containing(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(),
            [needle](const std::string& line) { return line.find(needle) != std::string::npos; }));
    }

    int flushes() const { return flushes_; }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    int flushes_ = 0;
};

}  // namespace crew_orchestrator::testing
