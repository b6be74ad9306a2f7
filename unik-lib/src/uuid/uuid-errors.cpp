#include "uuid-errors.hpp"
#include <string>

namespace unik{
    namespace {
        class UnikErrorCategory: public std::error_category
        {
        public:
            const char* name() const noexcept override { return "unik"; }
            std::string message(int ev) const override {
                switch(static_cast<errc>(ev)){
                    case errc::invalid_length:
                        return "invalid UUID string length";
                    case errc::invalid_character:
                        return "invalid UUID string";
                    case errc::truncated_buffer:
                        return "UUID byte buffer is truncated";
                    case errc::unrecognized_version:
                        return "unrecognized version";
                    case errc::unrecognized_variant:
                        return "unrecognized variant";
                }
                return "unknown unik error";
            }
        };
    }

    const std::error_category& error_category() noexcept {
        static const UnikErrorCategory category;
        return category;
    }

    std::error_code make_error_code(errc e) noexcept {
        return std::error_code(static_cast<int>(e), error_category());
    }
}
