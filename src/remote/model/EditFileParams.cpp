#include "remote/model/EditFileParams.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace loft::remote::model {

void to_json(nlohmann::json& j, const EditFileParams& p) {
    j = {
        {"password", p.password},
        {"published", p.published},
        {"publishedUntil", util::timestampToString(p.published_until)},
        {"shortLink", p.short_link},
        {"publicDownloadLink", p.public_download_link}
    };
}

}
