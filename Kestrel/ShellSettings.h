#pragma once

#include "BrowserSettings.h"
#include <QtCore/QString>

// Persists BrowserSettings through QSettings (organization "Kestrel").
class ShellSettings {
public:
  // Missing or unreadable keys fall back to the BrowserSettings defaults
  static Kestrel::BrowserSettings Load();
  static void Save(const Kestrel::BrowserSettings &settings);

  static QString LastTabPolicyToString(Kestrel::LastTabPolicy policy);
  static Kestrel::LastTabPolicy LastTabPolicyFromString(const QString &value);

  static QString NewWindowContentToString(Kestrel::NewWindowContent content);
  static Kestrel::NewWindowContent
  NewWindowContentFromString(const QString &value);
};
