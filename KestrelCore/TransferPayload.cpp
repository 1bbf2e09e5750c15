#include "TransferPayload.h"
#include "WindowRegistry.h"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Kestrel {

TransferPayload TransferPayload::Capture(const Tab &tab, WindowHandle source) {
  TransferPayload payload;
  payload.Id = tab.Id;
  payload.Title = tab.Title;
  payload.Address = tab.Address;
  payload.SourceWindow = source;
  return payload;
}

std::string TransferPayload::Serialize() const {
  json root;
  root["tabId"] = Id.Value;
  root["title"] = Title;
  root["url"] = Address;
  root["sourceWindowId"] = SourceWindow.Value;
  return root.dump();
}

std::optional<TransferPayload>
TransferPayload::Deserialize(const std::string &data) {
  try {
    json root = json::parse(data);

    TransferPayload payload;
    payload.Id.Value = root.at("tabId").get<uint64_t>();
    payload.Title = root.at("title").get<std::string>();
    payload.Address = root.at("url").get<std::string>();
    payload.SourceWindow.Value = root.at("sourceWindowId").get<uint64_t>();

    if (!payload.Id.IsValid() || !payload.SourceWindow.IsValid()) {
      std::cerr << "[TransferPayload] Drag data carries a zero id" << std::endl;
      return std::nullopt;
    }
    return payload;
  } catch (const std::exception &e) {
    std::cerr << "[TransferPayload] Decode failed: " << e.what() << std::endl;
    return std::nullopt;
  }
}

WindowContext *
TransferPayload::ResolveSource(const WindowRegistry &registry) const {
  WindowContext *source = registry.Find(SourceWindow);
  if (!source || !source->GetTabs().Contains(Id))
    return nullptr;
  return source;
}

} // namespace Kestrel
