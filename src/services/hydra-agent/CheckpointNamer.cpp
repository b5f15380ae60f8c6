#include "CheckpointNamer.hpp"

#include <cctype>
#include <array>
#include <exception>
#include <memory>
#include <random>
#include <utility>

namespace {
constexpr size_t kSeedWords = 8;

// One engine per namer, seeded once with the full 64-bit state in mind, so
// names stay independent of the thread a batch happens to run on.
CheckpointNamer::Generator SeededGenerator() {
    std::random_device device;
    std::array<std::random_device::result_type, kSeedWords> words{};
    for (auto& word : words) {
        word = device();
    }
    std::seed_seq seeds(words.begin(), words.end());
    auto engine = std::make_shared<std::mt19937_64>(seeds);
    return [engine]() { return (*engine)(); };
}
} // namespace

CheckpointNamer::CheckpointNamer(Generator generator)
    : generator_(std::move(generator)) {
    if (!generator_) {
        generator_ = SeededGenerator();
    }
}

std::string CheckpointNamer::Next() {
    uint64_t value = generator_();
    while (!issued_.insert(value).second) {
        value = generator_();
    }
    return std::to_string(value);
}

void CheckpointNamer::Reset() {
    issued_.clear();
}

size_t CheckpointNamer::Issued() const {
    return issued_.size();
}

bool CheckpointNamer::IsValidName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (const char ch : name) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }

    try {
        size_t index = 0;
        std::stoull(name, &index);
        return index == name.size();
    } catch (const std::exception&) {
        return false;
    }
}
