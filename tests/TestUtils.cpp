#include "TestUtils.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace sealstream::test {

std::vector<uint8_t> randomBytes(const size_t length, const uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution dis(0, 255);
    std::vector<uint8_t> bytes(length);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return bytes;
}

std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t>& data, const std::vector<size_t>& sizes) {
    if (sizes.empty()) {
        throw std::invalid_argument("sizes cannot be empty");
    }
    std::vector<std::vector<uint8_t>> fragments;
    size_t offset = 0;
    size_t index = 0;
    while (offset < data.size()) {
        const size_t size = std::min(sizes[std::min(index, sizes.size() - 1)], data.size() - offset);
        fragments.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                               data.begin() + static_cast<std::ptrdiff_t>(offset + size));
        offset += size;
        ++index;
    }
    return fragments;
}

std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>>& segments) {
    std::vector<uint8_t> result;
    for (const auto& segment : segments) {
        result.insert(result.end(), segment.begin(), segment.end());
    }
    return result;
}

std::vector<uint8_t> hexToBytes(const std::string& input) {
    if (input.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have an even length");
    }
    std::vector<uint8_t> result;
    result.reserve(input.size() / 2);
    for (size_t i = 0; i < input.size(); i += 2) {
        result.push_back(static_cast<uint8_t>(std::stoi(input.substr(i, 2), nullptr, 16)));
    }
    return result;
}

std::vector<uint8_t> runTransform(StreamTransform& transform, const std::vector<std::vector<uint8_t>>& chunks) {
    SegmentCollector collector;
    transform.start(collector.sink());
    for (const auto& chunk : chunks) {
        transform.transform(chunk, collector.sink());
    }
    transform.flush(collector.sink());
    return collector.bytes();
}

std::vector<uint8_t> sealAll(const Sealer& sealer, const std::vector<uint8_t>& plaintext,
                             const std::vector<uint8_t>& header) {
    auto pipeline = sealer.createEncryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(), header);
    return pipeline.run({plaintext});
}

std::vector<uint8_t> openAll(const Sealer& sealer, const std::vector<std::vector<uint8_t>>& fragments,
                             const std::vector<uint8_t>& header) {
    auto pipeline = sealer.createDecryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(), header);
    return pipeline.run(fragments);
}

}
