#include "ShellSettings.h"
#include <QtCore/QSettings>
#include <iostream>

using namespace Kestrel;

BrowserSettings ShellSettings::Load() {
  BrowserSettings settings;
  QSettings store("Kestrel", "Kestrel");

  bool ok = false;
  float threshold =
      store.value("drag/threshold", settings.DragThreshold).toFloat(&ok);
  if (ok && threshold >= 0.0f) {
    settings.DragThreshold = threshold;
  } else {
    std::cerr << "[ShellSettings] Ignoring invalid drag/threshold" << std::endl;
  }

  settings.LastTab = LastTabPolicyFromString(
      store.value("tabs/lastTabPolicy").toString());
  settings.NewWindowOpensWith = NewWindowContentFromString(
      store.value("windows/newWindowContent").toString());
  settings.Homepage = store.value("general/homepage", QString())
                          .toString()
                          .trimmed()
                          .toStdString();

  int width = store.value("windows/defaultWidth", 1024).toInt();
  int height = store.value("windows/defaultHeight", 768).toInt();
  if (width > 0 && height > 0) {
    settings.DefaultWindowSize = glm::vec2(width, height);
  }

  int capacity = store.value("history/recentlyClosedCapacity",
                             static_cast<int>(settings.RecentlyClosedCapacity))
                     .toInt();
  if (capacity > 0) {
    settings.RecentlyClosedCapacity = static_cast<size_t>(capacity);
  }

  return settings;
}

void ShellSettings::Save(const BrowserSettings &settings) {
  QSettings store("Kestrel", "Kestrel");
  store.setValue("drag/threshold", settings.DragThreshold);
  store.setValue("tabs/lastTabPolicy", LastTabPolicyToString(settings.LastTab));
  store.setValue("windows/newWindowContent",
                 NewWindowContentToString(settings.NewWindowOpensWith));
  store.setValue("general/homepage",
                 QString::fromStdString(settings.Homepage));
  store.setValue("windows/defaultWidth",
                 static_cast<int>(settings.DefaultWindowSize.x));
  store.setValue("windows/defaultHeight",
                 static_cast<int>(settings.DefaultWindowSize.y));
  store.setValue("history/recentlyClosedCapacity",
                 static_cast<int>(settings.RecentlyClosedCapacity));
  store.sync();

  if (store.status() != QSettings::NoError) {
    std::cerr << "[ShellSettings] Failed to write settings" << std::endl;
  }
}

QString ShellSettings::LastTabPolicyToString(LastTabPolicy policy) {
  switch (policy) {
  case LastTabPolicy::CloseWindow:
    return "closeWindow";
  case LastTabPolicy::KeepWindowWithBlankTab:
  default:
    return "keepWindow";
  }
}

LastTabPolicy ShellSettings::LastTabPolicyFromString(const QString &value) {
  if (value == "closeWindow") {
    return LastTabPolicy::CloseWindow;
  }
  return LastTabPolicy::KeepWindowWithBlankTab;
}

QString ShellSettings::NewWindowContentToString(NewWindowContent content) {
  switch (content) {
  case NewWindowContent::Homepage:
    return "homepage";
  case NewWindowContent::EmptyPage:
    return "emptyPage";
  case NewWindowContent::StartPage:
  default:
    return "startPage";
  }
}

NewWindowContent ShellSettings::NewWindowContentFromString(const QString &value) {
  if (value == "homepage") {
    return NewWindowContent::Homepage;
  }
  if (value == "emptyPage") {
    return NewWindowContent::EmptyPage;
  }
  return NewWindowContent::StartPage;
}
