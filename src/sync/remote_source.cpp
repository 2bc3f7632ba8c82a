#include "sync/remote_source.h"
#include "core/logger.h"

void to_json(json &j, const ClientMetadata &m) {
  j = json{{"sdkType", m.sdkType},
           {"sdkVersion", m.sdkVersion},
           {"sessionID", m.sessionId}};
}

HttpRemoteSource::HttpRemoteSource(std::shared_ptr<IHttpTransport> transport,
                                   ClientMetadata metadata)
    : transport_(std::move(transport)), metadata_(std::move(metadata)) {}

json HttpRemoteSource::postAndParse(const std::string &endpoint,
                                    const json &body) {
  HTTPResponse response = transport_->postJson(endpoint, body);
  if (!response.ok()) {
    throw RemoteSourceError(RemoteSourceError::Kind::TRANSPORT,
                            endpoint + " failed: " + response.error_message);
  }

  try {
    return json::parse(response.body);
  } catch (const json::parse_error &e) {
    throw RemoteSourceError(RemoteSourceError::Kind::DECODE,
                            endpoint + " returned malformed JSON: " +
                                std::string(e.what()));
  }
}

SyncSnapshot HttpRemoteSource::fetchConfigSnapshot(int64_t sinceTime) {
  json request = {{"sinceTime", sinceTime}, {"sdkMetadata", metadata_}};
  json payload = postAndParse("/download_config_specs", request);

  try {
    return payload.get<SyncSnapshot>();
  } catch (const std::exception &e) {
    throw RemoteSourceError(RemoteSourceError::Kind::DECODE,
                            "Unexpected config snapshot shape: " +
                                std::string(e.what()));
  }
}

// The catalog is a JSON object keyed by list name. An empty object is a valid
// "no lists" answer; anything that is not an object is a decode failure.
IDListCatalog HttpRemoteSource::fetchIDListCatalog() {
  json request = {{"sdkMetadata", metadata_}};
  json payload = postAndParse("/get_id_lists", request);

  if (!payload.is_object()) {
    throw RemoteSourceError(RemoteSourceError::Kind::DECODE,
                            "ID list catalog is not a JSON object");
  }

  IDListCatalog catalog;
  try {
    for (auto &item : payload.items()) {
      IDListMetadata entry = item.value().get<IDListMetadata>();
      if (entry.name.empty())
        entry.name = item.key();
      catalog.emplace(item.key(), std::move(entry));
    }
  } catch (const json::exception &e) {
    throw RemoteSourceError(RemoteSourceError::Kind::DECODE,
                            "Unexpected ID list catalog shape: " +
                                std::string(e.what()));
  }
  return catalog;
}

RangeResponse HttpRemoteSource::fetchRange(const std::string &url,
                                           int64_t byteOffset) {
  std::map<std::string, std::string> headers = {
      {"Range", "bytes=" + std::to_string(byteOffset) + "-"}};
  HTTPResponse response = transport_->get(url, headers);
  if (!response.ok()) {
    throw RemoteSourceError(RemoteSourceError::Kind::TRANSPORT,
                            "Range fetch of " + url + " failed: " +
                                response.error_message);
  }

  RangeResponse result;
  result.content = std::move(response.body);

  std::string lengthHeader = response.header("content-length");
  if (!lengthHeader.empty()) {
    try {
      result.contentLength = std::stoll(lengthHeader);
    } catch (const std::exception &) {
      Logger::warning(LogCategory::NETWORK, "fetchRange",
                      "Invalid content-length '" + lengthHeader + "' from " +
                          url);
      result.contentLength = -1;
    }
  }
  return result;
}
