#ifndef UNIK_UUID_ERRORS_HPP
#define UNIK_UUID_ERRORS_HPP
#include <system_error>

namespace unik{
    // Recoverable errors reported by the parsing and interpretation
    // functions. Malformed input and unrecognized tags are expected
    // when reading foreign data, so these are returned as error codes
    // rather than thrown (throwing overloads wrap them in std::system_error).
    enum class errc
    {
        invalid_length = 1,
        invalid_character,
        truncated_buffer,
        unrecognized_version,
        unrecognized_variant
    };

    const std::error_category& error_category() noexcept;
    std::error_code make_error_code(errc e) noexcept;
}// unik namespace

namespace std{
    template<>
    struct is_error_code_enum<unik::errc>: true_type {};
}
#endif
