/**
 * @file errors.hpp
 * @brief Exception hierarchy for pipeline collaborators
 *
 * @details Task-level errors (DecodeError, GenerationError, PersistError) are
 *          caught by the worker loop and turned into a Failed task. A
 *          DeviceError is job-fatal. StoppedError is thrown by a pipeline that
 *          noticed the cancellation flag mid-stage.
 */

#ifndef CAPTION_SUITE_ERRORS_HPP
#define CAPTION_SUITE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace caption_suite {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Media could not be opened or decoded
class DecodeError : public Error {
public:
  using Error::Error;
};

/// The model failed on a single item
class GenerationError : public Error {
public:
  using Error::Error;
};

/// Caption artifact could not be written
class PersistError : public Error {
public:
  using Error::Error;
};

/// Device or model unavailable; fatal for the whole job
class DeviceError : public Error {
public:
  using Error::Error;
};

/// Invalid settings override
class SettingsError : public Error {
public:
  using Error::Error;
};

/// Malformed request payload
class RequestError : public Error {
public:
  using Error::Error;
};

/// Pipeline abandoned because a stop was requested
class StoppedError : public Error {
public:
  StoppedError() : Error("stopped") {}
};

} // namespace caption_suite

#endif // CAPTION_SUITE_ERRORS_HPP
