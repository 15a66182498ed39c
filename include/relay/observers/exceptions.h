#ifndef RELAY_OBSERVERS_EXCEPTIONS_H
#define RELAY_OBSERVERS_EXCEPTIONS_H

#include <relay/types/value.h>

#include <exception>
#include <stdexcept>

namespace relay {
    /**
     * Base for all observation based exceptions.
     */
    struct RELAY_EXPORT ObserverError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * Skip the current dispatch: no update is applied and nothing is logged.
     */
    struct RELAY_EXPORT PreventUpdate : ObserverError {
        PreventUpdate() : ObserverError("Update prevented") {}

        using ObserverError::ObserverError;
    };

    /**
     * The instance a method observer was bound to no longer exists. Handled as a skip.
     */
    struct RELAY_EXPORT InstanceExpired : PreventUpdate {
        using PreventUpdate::PreventUpdate;
    };

    /**
     * An observer callback was requested that does not exist or has not been registered.
     */
    struct RELAY_EXPORT UnknownObserver : ObserverError {
        using ObserverError::ObserverError;
    };

    /**
     * A registry configured to reject duplicates was given a second observer with the same identity.
     */
    struct RELAY_EXPORT DuplicateObserver : ObserverError {
        using ObserverError::ObserverError;
    };

    /**
     * A dependency was declared against an object that has no id.
     */
    struct RELAY_EXPORT MissingComponentId : ObserverError {
        using ObserverError::ObserverError;
    };

    /**
     * A property was requested from a component that does not have it.
     */
    struct RELAY_EXPORT UnknownProperty : ObserverError {
        using ObserverError::ObserverError;
    };

    /**
     * Errors that must never be contained by the dispatch machinery, such as a deliberate request to terminate.
     * Anything not derived from std::exception is treated the same way.
     */
    struct RELAY_EXPORT FatalError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * True for ordinary errors that may be logged and contained, false for fatal ones.
     */
    [[nodiscard]] RELAY_EXPORT bool is_recoverable(const std::exception_ptr &error);

    /**
     * True when the error is a PreventUpdate (or derived) signal.
     */
    [[nodiscard]] RELAY_EXPORT bool is_prevent_update(const std::exception_ptr &error);

    struct ErrorDescription {
        std::string type_name;
        std::string message;
    };

    /**
     * Dynamic type name and message of an error, for reporting.
     */
    [[nodiscard]] RELAY_EXPORT ErrorDescription describe_error(const std::exception_ptr &error);

    /**
     * The payload passed to observers triggered by a Raised dependency.
     */
    struct RELAY_EXPORT CallbackError : Object {
        CallbackError(std::string observer_id, std::exception_ptr error);

        [[nodiscard]] const std::string &observer_id() const { return _observer_id; }

        [[nodiscard]] const std::string &type_name() const { return _description.type_name; }

        [[nodiscard]] const std::string &message() const { return _description.message; }

        [[nodiscard]] const std::exception_ptr &error() const { return _error; }

        [[nodiscard]] std::string to_string() const override;

    private:
        std::string _observer_id;
        std::exception_ptr _error;
        ErrorDescription _description;
    };
} // namespace relay

#endif // RELAY_OBSERVERS_EXCEPTIONS_H
