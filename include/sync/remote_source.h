#ifndef REMOTE_SOURCE_H
#define REMOTE_SOURCE_H

#include "engines/http_transport.h"
#include "model/config_spec.h"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

class RemoteSourceError : public std::runtime_error {
public:
  enum class Kind { TRANSPORT, DECODE };

  RemoteSourceError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

struct RangeResponse {
  std::string content;
  // Value of the content-length response header, -1 when absent or invalid.
  int64_t contentLength = -1;
};

using IDListCatalog = std::unordered_map<std::string, IDListMetadata>;

// Server side of the replica. Implementations throw RemoteSourceError for
// transport failures and for payloads that cannot be decoded.
class IRemoteSource {
public:
  virtual ~IRemoteSource() = default;

  virtual SyncSnapshot fetchConfigSnapshot(int64_t sinceTime) = 0;
  virtual IDListCatalog fetchIDListCatalog() = 0;
  virtual RangeResponse fetchRange(const std::string &url,
                                   int64_t byteOffset) = 0;
};

struct ClientMetadata {
  std::string sdkType = "flagsync-cpp";
  std::string sdkVersion = "1.0.0";
  std::string sessionId;
};

void to_json(json &j, const ClientMetadata &m);

class HttpRemoteSource : public IRemoteSource {
  std::shared_ptr<IHttpTransport> transport_;
  ClientMetadata metadata_;

public:
  HttpRemoteSource(std::shared_ptr<IHttpTransport> transport,
                   ClientMetadata metadata);

  SyncSnapshot fetchConfigSnapshot(int64_t sinceTime) override;
  IDListCatalog fetchIDListCatalog() override;
  RangeResponse fetchRange(const std::string &url,
                           int64_t byteOffset) override;


private:
  json postAndParse(const std::string &endpoint, const json &body);
};

#endif
