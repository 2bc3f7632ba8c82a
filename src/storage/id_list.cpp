#include "storage/id_list.h"
#include <utility>

IDList::IDList(std::string name)
    : name_(std::move(name)), creationTime_(0) {}

IDList::IDList(std::string name, int64_t creationTime, std::string url,
               std::string fileID)
    : name_(std::move(name)), creationTime_(creationTime),
      url_(std::move(url)), fileID_(std::move(fileID)) {}
