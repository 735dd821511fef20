#ifndef KHEAP_VERSION_HPP
#define KHEAP_VERSION_HPP

#pragma once

namespace kheap {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 1;

    /// Combined version string (e.g. "0.3.1")
    inline constexpr const char* version_string = "0.3.1";

} // namespace kheap

#endif // KHEAP_VERSION_HPP
