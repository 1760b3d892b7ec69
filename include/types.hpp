#pragma once

#include <string>
#include <vector>

namespace packager {

// Одна группа <types> в package.xml: метка типа и имена всех найденных в папке сущностей.
struct TypeGroup {
    std::string type_name;
    std::vector<std::string> members;
    bool mapped{true};  // false, если папки нет в реестре и type_name - это сырое имя папки.
};

struct Manifest {
    std::vector<TypeGroup> groups;
    std::string api_version;
    std::string xml_namespace;
};

}  // namespace packager
