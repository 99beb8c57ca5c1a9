#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace mapstream {

static const uint64_t kFnvOffsetBasis = 1469598103934665603ULL;
static const uint64_t kFnvPrime = 1099511628211ULL;

// FNV-1a 64; pass a previous result as `h` to hash several fields in sequence.
inline uint64_t fnv1a64(const void* data, size_t len, uint64_t h = kFnvOffsetBasis){
    const uint8_t* p = (const uint8_t*)data;
    for(size_t i=0;i<len;i++){ h ^= p[i]; h *= kFnvPrime; }
    return h;
}
inline uint64_t fnv1a64_str(const std::string& s, uint64_t h = kFnvOffsetBasis){
    return fnv1a64(s.data(), s.size(), h);
}

inline std::string hex64(uint64_t v){
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
    return std::string(buf);
}

} // namespace mapstream
