#include "prediction/prediction_result.hpp"

namespace attrtools {

nlohmann::json PredictionResult::toJson() const {
    nlohmann::json j;
    if (ok()) {
        j["label"] = {
            {"labels", scores().labels},
            {"probas", scores().probas},
        };
    } else {
        j["label"] = resultCode(error());
    }
    j["db_version"] = db_version_;
    return j;
}

} // namespace attrtools
