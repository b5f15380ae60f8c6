#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

// Hands out checkpoint names as decimal 64-bit integers. A draw that was
// already issued since the last Reset() is discarded and redrawn, so names
// inside one batch never collide.
class CheckpointNamer {
public:
    using Generator = std::function<uint64_t()>;

    explicit CheckpointNamer(Generator generator = Generator());

    std::string Next();
    void Reset();
    size_t Issued() const;

    static bool IsValidName(const std::string& name);

private:
    Generator generator_;
    std::unordered_set<uint64_t> issued_;
};
