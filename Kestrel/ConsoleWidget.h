#pragma once

#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QTextEdit>
#include <QtWidgets/QVBoxLayout>
#include <QtWidgets/QWidget>
#include <string>

namespace Kestrel {
struct TransferError;
class TransferErrorLog;
} // namespace Kestrel

// ConsoleWidget - Rich text console for tab transfer diagnostics
class ConsoleWidget : public QWidget {
public:
  explicit ConsoleWidget(QWidget *parent = nullptr);
  ~ConsoleWidget();

  // Singleton access for global console
  static ConsoleWidget *Instance();

  // Print methods with different severity levels
  void Print(const std::string &message);
  void PrintWarning(const std::string &message);
  void PrintError(const std::string &message);
  void PrintDebug(const std::string &message);

  // Routes a protocol condition to the matching level
  void PrintTransferError(const Kestrel::TransferError &error);

  // Log whose counters the status line shows
  void SetErrorLog(Kestrel::TransferErrorLog *log);

  // Clear console output and the log behind it
  void Clear();

  QSize sizeHint() const override { return QSize(800, 200); }

private:
  void appendHtml(const QString &html);
  void updateStatus();

  QTextEdit *m_textEdit;
  QPushButton *m_clearButton;
  QLabel *m_statusLabel;

  Kestrel::TransferErrorLog *m_errorLog = nullptr;

  static ConsoleWidget *s_Instance;
};
