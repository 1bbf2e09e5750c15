#include "BrowserShell.h"
#include "ShellSettings.h"

#include <QApplication>
#include <QPalette>
#include <QStyleFactory>

int main(int argc, char *argv[]) {
  QApplication::setHighDpiScaleFactorRoundingPolicy(
      Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);

  QApplication app(argc, argv);
  app.setOrganizationName("Kestrel");
  app.setApplicationName("Kestrel");

  QApplication::setStyle(QStyleFactory::create("Fusion"));

  QPalette darkPalette;
  darkPalette.setColor(QPalette::Window, QColor(53, 53, 53));
  darkPalette.setColor(QPalette::WindowText, Qt::white);
  darkPalette.setColor(QPalette::Base, QColor(42, 42, 42));
  darkPalette.setColor(QPalette::AlternateBase, QColor(66, 66, 66));
  darkPalette.setColor(QPalette::ToolTipBase, Qt::white);
  darkPalette.setColor(QPalette::ToolTipText, Qt::white);
  darkPalette.setColor(QPalette::Text, Qt::white);
  darkPalette.setColor(QPalette::Button, QColor(53, 53, 53));
  darkPalette.setColor(QPalette::ButtonText, Qt::white);
  darkPalette.setColor(QPalette::BrightText, Qt::red);
  darkPalette.setColor(QPalette::Highlight, QColor(90, 90, 90));
  darkPalette.setColor(QPalette::HighlightedText, Qt::white);
  app.setPalette(darkPalette);

  Kestrel::BrowserSettings settings = ShellSettings::Load();
  ShellSettings::Save(settings);

  BrowserShell shell(settings);
  if (!shell.GetLifecycle().OpenWindow().IsValid()) {
    return 1;
  }
  return app.exec();
}
