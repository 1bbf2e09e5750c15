#include "TransferError.h"
#include <algorithm>
#include <iostream>

namespace Kestrel {

const char *TransferErrorCodeToString(TransferErrorCode code) {
  switch (code) {
  case TransferErrorCode::StaleReference:
    return "StaleReference";
  case TransferErrorCode::NoDropTarget:
    return "NoDropTarget";
  case TransferErrorCode::AmbiguousIndex:
    return "AmbiguousIndex";
  case TransferErrorCode::TransferFailure:
    return "TransferFailure";
  case TransferErrorCode::MalformedPayload:
    return "MalformedPayload";
  }
  return "Unknown";
}

void TransferErrorLog::Report(TransferErrorSeverity severity,
                              TransferErrorCode code,
                              const std::string &message,
                              const std::string &context) {
  TransferError error{severity, code, message, context};
  m_Errors.push_back(error);

  if (severity == TransferErrorSeverity::Warning)
    m_WarningCount++;
  else if (severity == TransferErrorSeverity::Error)
    m_ErrorCount++;
  Trim();

  if (severity == TransferErrorSeverity::Error)
    std::cerr << "[Transfer] " << error.ToString() << std::endl;
  else
    std::cout << "[Transfer] " << error.ToString() << std::endl;

  if (m_Listener)
    m_Listener(error);
}

void TransferErrorLog::ListErrors() const {
  if (m_Errors.empty()) {
    std::cout << "No transfer issues reported." << std::endl;
    return;
  }

  std::cout << "=== Transfer Log ===" << std::endl;
  std::cout << "Total: " << m_Errors.size() << " entries - " << m_ErrorCount
            << " error(s), " << m_WarningCount << " warning(s)" << std::endl;
  for (size_t i = 0; i < m_Errors.size(); i++) {
    std::cout << (i + 1) << ". " << m_Errors[i].ToString() << std::endl;
  }
}

size_t TransferErrorLog::CountOf(TransferErrorCode code) const {
  return static_cast<size_t>(
      std::count_if(m_Errors.begin(), m_Errors.end(),
                    [code](const TransferError &e) { return e.code == code; }));
}

void TransferErrorLog::SetCapacity(size_t capacity) {
  m_Capacity = std::max<size_t>(capacity, 1);
  Trim();
}

void TransferErrorLog::Forget(const TransferError &error) {
  if (error.severity == TransferErrorSeverity::Warning)
    m_WarningCount--;
  else if (error.severity == TransferErrorSeverity::Error)
    m_ErrorCount--;
}

void TransferErrorLog::Trim() {
  if (m_Errors.size() <= m_Capacity)
    return;

  size_t excess = m_Errors.size() - m_Capacity;
  for (size_t i = 0; i < excess; i++)
    Forget(m_Errors[i]);
  m_Errors.erase(m_Errors.begin(), m_Errors.begin() + excess);
}

void TransferErrorLog::Clear() {
  m_Errors.clear();
  m_WarningCount = 0;
  m_ErrorCount = 0;
}

} // namespace Kestrel
