#include <relay/observers/exceptions.h>

namespace relay {
    bool is_recoverable(const std::exception_ptr &error) {
        if (!error) { return false; }
        try {
            std::rethrow_exception(error);
        } catch (const FatalError &) {
            return false;
        } catch (const std::exception &) {
            return true;
        } catch (...) {
            return false;
        }
    }

    bool is_prevent_update(const std::exception_ptr &error) {
        if (!error) { return false; }
        try {
            std::rethrow_exception(error);
        } catch (const PreventUpdate &) {
            return true;
        } catch (...) {
            return false;
        }
    }

    ErrorDescription describe_error(const std::exception_ptr &error) {
        if (!error) { return {"null", ""}; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return {relay::type_name(typeid(e)), e.what()};
        } catch (...) {
            return {"unknown", "non-standard exception"};
        }
    }

    CallbackError::CallbackError(std::string observer_id, std::exception_ptr error)
        : _observer_id{std::move(observer_id)}, _error{std::move(error)}, _description{describe_error(_error)} {
    }

    std::string CallbackError::to_string() const {
        return fmt::format("CallbackError({}, {}: {})", _observer_id, _description.type_name, _description.message);
    }
} // namespace relay
