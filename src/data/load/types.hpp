#ifndef MEDCAP_TYPES_HPP
#define MEDCAP_TYPES_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Medcap::Data {
    // One image of one study, joined with the report of that study.
    struct StudyRecord {
        std::string subject_id;
        std::string study_id;
        std::string dicom_id;
        std::string view_position;
        std::string split;
        std::string image_path;
        std::optional<std::string> report{}; // nullopt: the source had no usable text
    };
}

namespace Medcap::Data::Type {
    struct CatalogPaths {
        std::filesystem::path split_csv;
        std::filesystem::path metadata_csv;
        std::filesystem::path sections_csv;
        std::filesystem::path image_root;
    };

    struct CatalogColumns {
        std::string dicom_id = "dicom_id";
        std::string study_id = "study_id";
        std::string subject_id = "subject_id";
        std::string split = "split";
        std::string view_position = "ViewPosition";
        std::string report = "impression";
    };

    struct CatalogOptions {
        std::vector<std::string> allowed_views{"AP", "PA"}; // empty = every view
        CatalogColumns columns{};
        char delimiter = ',';
        std::string image_extension = ".jpg";
    };
}
#endif //MEDCAP_TYPES_HPP
