#pragma once

#include <cstddef>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace Kestrel {

// Error severity levels
enum class TransferErrorSeverity {
  Info,    // Expected outcome worth tracing
  Warning, // Recovered locally, the gesture still completed
  Error    // The gesture was rolled back or refused
};

enum class TransferErrorCode {
  StaleReference,   // Origin tab or window gone at resolution
  NoDropTarget,     // Drop outside every window (the detach path)
  AmbiguousIndex,   // Destination anchor vanished, appended instead
  TransferFailure,  // Destination gone mid-transfer, origin rolled back
  MalformedPayload  // Drag data did not decode
};

const char *TransferErrorCodeToString(TransferErrorCode code);

// Recoverable protocol condition, kept for diagnostics
struct TransferError {
  TransferErrorSeverity severity;
  TransferErrorCode code;
  std::string message;
  std::string context; // Operation that reported it

  std::string GetSeverityString() const {
    switch (severity) {
    case TransferErrorSeverity::Info:
      return "Info";
    case TransferErrorSeverity::Warning:
      return "Warning";
    case TransferErrorSeverity::Error:
      return "Error";
    default:
      return "Unknown";
    }
  }

  std::string ToString() const {
    std::ostringstream ss;
    ss << "[" << GetSeverityString() << "] "
       << TransferErrorCodeToString(code) << " - " << message;
    if (!context.empty()) {
      ss << " (in " << context << ")";
    }
    return ss.str();
  }
};

// Collects everything the protocol resolved locally. Nothing here ever
// reaches the user as an error dialog.
class TransferErrorLog {
public:
  using Listener = std::function<void(const TransferError &)>;

  static constexpr size_t DefaultCapacity = 256;

  TransferErrorLog() = default;

  void Report(TransferErrorSeverity severity, TransferErrorCode code,
              const std::string &message, const std::string &context = "");

  // Print all entries to the console
  void ListErrors() const;

  const std::vector<TransferError> &GetErrors() const { return m_Errors; }
  size_t Count() const { return m_Errors.size(); }
  size_t CountOf(TransferErrorCode code) const;
  bool HasErrors() const { return m_ErrorCount > 0; }
  const TransferError *Last() const {
    return m_Errors.empty() ? nullptr : &m_Errors.back();
  }

  void Clear();

  // Oldest entries are dropped once the log holds this many. Zero keeps
  // a single entry.
  void SetCapacity(size_t capacity);
  size_t GetCapacity() const { return m_Capacity; }

  // Called for each new entry (the shell console subscribes here)
  void SetListener(Listener listener) { m_Listener = std::move(listener); }

private:
  void Forget(const TransferError &error);
  void Trim();

  std::vector<TransferError> m_Errors;
  size_t m_WarningCount = 0;
  size_t m_ErrorCount = 0;
  size_t m_Capacity = DefaultCapacity;
  Listener m_Listener;
};

} // namespace Kestrel
