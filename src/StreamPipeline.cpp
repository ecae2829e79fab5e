#include "sealstream/StreamPipeline.hpp"
#include "sealstream/SealException.hpp"
#include <string>
#include <utility>

namespace sealstream {

StreamPipeline::StreamPipeline() : started_(false) {
}

StreamPipeline::~StreamPipeline() = default;

StreamPipeline::StreamPipeline(StreamPipeline&&) noexcept = default;

StreamPipeline& StreamPipeline::operator=(StreamPipeline&&) noexcept = default;

StreamPipeline& StreamPipeline::then(std::unique_ptr<StreamTransform> stage) {
    if (started_) {
        throw SealException("cannot add a stage to a started pipeline");
    }
    if (!stage) {
        throw InvalidParametersException("pipeline stage cannot be null");
    }
    stages_.push_back(std::move(stage));
    return *this;
}

StreamTransform& StreamPipeline::stage(const size_t index) const {
    if (index >= stages_.size()) {
        throw SealException("pipeline stage " + std::to_string(index) + " out of range");
    }
    return *stages_[index];
}

void StreamPipeline::start(const SegmentSink& sink) {
    if (started_) {
        throw SealException("pipeline has already been started");
    }
    started_ = true;
    try {
        for (size_t i = 0; i < stages_.size(); ++i) {
            stages_[i]->start(forwarder(i + 1, sink));
        }
    } catch (const std::exception&) {
        cancel();
        throw;
    }
}

void StreamPipeline::write(const std::span<const uint8_t> fragment, const SegmentSink& sink) {
    try {
        emitTo(0, std::vector<uint8_t>(fragment.begin(), fragment.end()), sink);
    } catch (const std::exception&) {
        cancel();
        throw;
    }
}

void StreamPipeline::close(const SegmentSink& sink) {
    try {
        // Flushing stage i may still feed stage i + 1, so flush front to back.
        for (size_t i = 0; i < stages_.size(); ++i) {
            stages_[i]->flush(forwarder(i + 1, sink));
        }
    } catch (const std::exception&) {
        cancel();
        throw;
    }
}

void StreamPipeline::cancel() {
    for (const auto& stage : stages_) {
        stage->cancel();
    }
}

std::vector<uint8_t> StreamPipeline::run(const std::vector<std::vector<uint8_t>>& fragments) {
    std::vector<uint8_t> output;
    const SegmentSink collect = [&output](std::vector<uint8_t> segment) {
        output.insert(output.end(), segment.begin(), segment.end());
    };

    start(collect);
    for (const auto& fragment : fragments) {
        write(fragment, collect);
    }
    close(collect);
    return output;
}

void StreamPipeline::emitTo(const size_t index, std::vector<uint8_t> segment, const SegmentSink& sink) {
    if (index == stages_.size()) {
        sink(std::move(segment));
        return;
    }
    stages_[index]->transform(segment, forwarder(index + 1, sink));
}

SegmentSink StreamPipeline::forwarder(const size_t index, const SegmentSink& sink) {
    return [this, index, &sink](std::vector<uint8_t> segment) {
        emitTo(index, std::move(segment), sink);
    };
}

}
