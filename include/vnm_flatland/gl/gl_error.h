#pragma once

// VNM Flatland Library - GL Error Checks

namespace vnm::flatland {

// glGetError codes used below (values fixed by the GL specification)
constexpr unsigned int k_gl_no_error      = 0;
constexpr unsigned int k_gl_out_of_memory = 0x0505;

// Errors drained before an allocation; bounds the loop if the context is lost.
constexpr int k_max_stale_gl_errors = 32;

// Runs `allocate` and reports whether it ran out of memory. Errors already
// pending are discarded first, since glGetError returns the oldest one.
template <typename Get_error, typename Allocate>
bool allocation_out_of_memory(Get_error&& get_error, Allocate&& allocate)
{
    for (int i = 0; i < k_max_stale_gl_errors && get_error() != k_gl_no_error; ++i) {
    }

    allocate();

    bool out_of_memory = false;
    for (int i = 0; i < k_max_stale_gl_errors; ++i) {
        const unsigned int error = get_error();
        if (error == k_gl_no_error) {
            break;
        }
        if (error == k_gl_out_of_memory) {
            out_of_memory = true;
        }
    }
    return out_of_memory;
}

} // namespace vnm::flatland
