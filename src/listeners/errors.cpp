#include "scout/listeners/errors.hpp"

namespace scout::listeners {

bool is_not_supported(const std::exception_ptr& error) noexcept {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const NotSupportedError&) {
        return true;
    } catch (...) {
        return false;
    }
}

}  // namespace scout::listeners
