#include "ConsoleWidget.h"
#include "TransferError.h"
#include <QtGui/QFont>
#include <QtWidgets/QScrollBar>

// Static instance
ConsoleWidget *ConsoleWidget::s_Instance = nullptr;

ConsoleWidget::ConsoleWidget(QWidget *parent) : QWidget(parent) {
  QVBoxLayout *mainLayout = new QVBoxLayout(this);
  mainLayout->setContentsMargins(0, 0, 0, 0);
  mainLayout->setSpacing(0);

  // Toolbar with clear button and error counters
  QHBoxLayout *toolbarLayout = new QHBoxLayout();
  toolbarLayout->setContentsMargins(4, 2, 4, 2);

  m_clearButton = new QPushButton("Clear", this);
  m_clearButton->setFixedWidth(60);
  m_clearButton->setFixedHeight(22);
  connect(m_clearButton, &QPushButton::clicked, this, &ConsoleWidget::Clear);

  m_statusLabel = new QLabel(this);
  m_statusLabel->setStyleSheet("QLabel { color: #808080; }");

  toolbarLayout->addWidget(m_clearButton);
  toolbarLayout->addStretch();
  toolbarLayout->addWidget(m_statusLabel);
  mainLayout->addLayout(toolbarLayout);

  m_textEdit = new QTextEdit(this);
  m_textEdit->setReadOnly(true);
  m_textEdit->setAcceptRichText(true);

  QFont font("Consolas", 10);
  font.setStyleHint(QFont::Monospace);
  m_textEdit->setFont(font);

  m_textEdit->setStyleSheet("QTextEdit {"
                            "  background-color: #1e1e1e;"
                            "  color: #d4d4d4;"
                            "  border: none;"
                            "  selection-background-color: #264f78;"
                            "}");

  mainLayout->addWidget(m_textEdit);
  setLayout(mainLayout);

  // Set as global instance if not already set
  if (!s_Instance) {
    s_Instance = this;
  }
}

ConsoleWidget::~ConsoleWidget() {
  if (s_Instance == this) {
    s_Instance = nullptr;
  }
}

ConsoleWidget *ConsoleWidget::Instance() { return s_Instance; }

void ConsoleWidget::Print(const std::string &message) {
  QString html = QString("<span style='color:#d4d4d4;'>%1</span>")
                     .arg(QString::fromStdString(message).toHtmlEscaped());
  appendHtml(html);
}

void ConsoleWidget::PrintWarning(const std::string &message) {
  QString html = QString("<span style='color:#dcdcaa;'>[WARNING] %1</span>")
                     .arg(QString::fromStdString(message).toHtmlEscaped());
  appendHtml(html);
}

void ConsoleWidget::PrintError(const std::string &message) {
  QString html = QString("<span style='color:#f14c4c;'>[ERROR] %1</span>")
                     .arg(QString::fromStdString(message).toHtmlEscaped());
  appendHtml(html);
}

void ConsoleWidget::PrintDebug(const std::string &message) {
  QString html = QString("<span style='color:#808080;'>[DEBUG] %1</span>")
                     .arg(QString::fromStdString(message).toHtmlEscaped());
  appendHtml(html);
}

void ConsoleWidget::PrintTransferError(const Kestrel::TransferError &error) {
  std::string line = std::string(Kestrel::TransferErrorCodeToString(error.code)) +
                     " - " + error.message;
  if (!error.context.empty()) {
    line += " (" + error.context + ")";
  }

  switch (error.severity) {
  case Kestrel::TransferErrorSeverity::Info:
    PrintDebug(line);
    break;
  case Kestrel::TransferErrorSeverity::Warning:
    PrintWarning(line);
    break;
  case Kestrel::TransferErrorSeverity::Error:
    PrintError(line);
    break;
  }
  updateStatus();
}

void ConsoleWidget::SetErrorLog(Kestrel::TransferErrorLog *log) {
  m_errorLog = log;
  updateStatus();
}

void ConsoleWidget::Clear() {
  m_textEdit->clear();
  if (m_errorLog) {
    m_errorLog->Clear();
  }
  updateStatus();
}

void ConsoleWidget::appendHtml(const QString &html) {
  m_textEdit->append(html);

  // Auto-scroll to bottom
  QScrollBar *scrollBar = m_textEdit->verticalScrollBar();
  scrollBar->setValue(scrollBar->maximum());
}

void ConsoleWidget::updateStatus() {
  if (!m_errorLog) {
    m_statusLabel->clear();
    return;
  }

  size_t failures =
      m_errorLog->CountOf(Kestrel::TransferErrorCode::TransferFailure);
  m_statusLabel->setText(QString("%1 reported, %2 rolled back")
                             .arg(static_cast<qulonglong>(m_errorLog->Count()))
                             .arg(static_cast<qulonglong>(failures)));
}
