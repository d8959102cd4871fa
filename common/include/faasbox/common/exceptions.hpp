#ifndef FAASBOX_COMMON_EXCEPTIONS_HPP
#define FAASBOX_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace faasbox::common {

  struct FaasboxException : std::runtime_error {

    FaasboxException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : FaasboxException {

    InvalidConfigurationError(const std::string& msg) : FaasboxException(msg) {}
  };

  struct ObjectDoesNotExist : FaasboxException {

    ObjectDoesNotExist(const std::string& name) : FaasboxException(name) {}
  };

  // Bad input supplied by the caller, reported with a 4xx status.
  struct ClientInputError : FaasboxException {

    ClientInputError(const std::string& msg) : FaasboxException(msg) {}
  };

  struct UploadTooLarge : ClientInputError {

    UploadTooLarge(const std::string& msg) : ClientInputError(msg) {}
  };

  struct InvalidRequest : ClientInputError {

    InvalidRequest(const std::string& msg) : ClientInputError(msg) {}
  };

  struct NoHandlerFound : ClientInputError {

    NoHandlerFound(const std::string& msg) : ClientInputError(msg) {}
  };

  struct UnsupportedLanguage : ClientInputError {

    UnsupportedLanguage(const std::string& language)
        : ClientInputError("Unsupported language: " + language)
    {
    }
  };

  // Host-side failures: filesystem, directory creation, templates.
  struct ResourceError : FaasboxException {

    ResourceError(const std::string& msg) : FaasboxException(msg) {}
  };

  struct ArchiveOpenError : ResourceError {

    ArchiveOpenError(const std::string& msg) : ResourceError(msg) {}
  };

  struct DirectoryCreationError : ResourceError {

    DirectoryCreationError(const std::string& msg) : ResourceError(msg) {}
  };

  struct IOError : ResourceError {

    IOError(const std::string& msg) : ResourceError(msg) {}
  };

  struct TemplateLoadError : ResourceError {

    TemplateLoadError(const std::string& msg) : ResourceError(msg) {}
  };

  struct WriteError : ResourceError {

    WriteError(const std::string& msg) : ResourceError(msg) {}
  };

  // External toolchain exited with a non-zero status; keeps its captured output.
  struct ToolchainError : FaasboxException {

    ToolchainError(const std::string& msg, std::string output)
        : FaasboxException(msg), _output(std::move(output))
    {
    }

    const std::string& output() const
    {
      return _output;
    }

  private:
    std::string _output;
  };

  struct BuildFailed : ToolchainError {

    BuildFailed(const std::string& msg, std::string output)
        : ToolchainError(msg, std::move(output))
    {
    }
  };

  struct ExecutionFailed : ToolchainError {

    ExecutionFailed(const std::string& msg, std::string output)
        : ToolchainError(msg, std::move(output))
    {
    }
  };

  struct TimeoutError : FaasboxException {

    TimeoutError(const std::string& msg) : FaasboxException(msg) {}
  };

} // namespace faasbox::common

#endif
