#ifndef __BANDS_HPP__
#define __BANDS_HPP__

#include <vector>
#include <string>
#include <map>
#include <memory>

#include "specindex.h"
#include "raster.hpp"
#include "util.hpp"

namespace specindex {

    namespace bands {

        // The spectral role a band plays in an index formula.
        enum class Role {
            Blue,
            Green,
            Red,
            NIR,
            SWIR1,
            SWIR2
        };

        // Return the name of a role, e.g. "NIR".
        std::string roleName(Role role);

        // Maps spectral roles to the band identifiers used in file names.
        class DLL_EXPORT BandMap {
        private:
            std::string m_sensor;
            std::map<Role, std::string> m_ids;

        public:
            // The default map is Landsat 8 OLI.
            BandMap();

            // Blue=B2, Green=B3, Red=B4, NIR=B5, SWIR1=B6, SWIR2=B7.
            static BandMap landsat8();

            // Blue=B02, Green=B03, Red=B04, NIR=B08, SWIR1=B11, SWIR2=B12.
            static BandMap sentinel2();

            // Return the preset with the given name ("landsat8" or "sentinel2").
            static BandMap fromName(const std::string &name);

            // The name of the sensor preset this map was built from.
            const std::string& sensor() const;

            const std::string& id(Role role) const;

            void set(Role role, const std::string &id);

            // Return the identifiers for the given roles, in order.
            std::vector<std::string> ids(const std::vector<Role> &roles) const;
        };

        // A band loaded from a scene: its grid and spatial reference.
        class DLL_EXPORT Band {
        public:
            std::string id;
            std::string filename;
            std::unique_ptr<specindex::raster::MemRaster<float> > grid;
            specindex::raster::GeoRef georef;
        };

        // Locates and loads the bands of a single scene directory. Loaded
        // bands are cached so that a band shared by several indices is read
        // once.
        class DLL_EXPORT BandLoader {
        private:
            std::string m_path;
            std::string m_scene;
            std::vector<std::string> m_files;
            std::map<std::string, std::unique_ptr<Band> > m_cache;
            specindex::util::Logger &m_log;

            // Read the band from the file into a new Band.
            std::unique_ptr<Band> read(const std::string &id, const std::string &filename);

        public:
            // List the scene directory. Throws SceneFatalError if it is
            // missing or cannot be read.
            BandLoader(const std::string &scenePath, specindex::util::Logger &log);

            // The scene identifier (the directory name).
            const std::string& scene() const;

            const std::string& path() const;

            // Returns true if the file name carries the band identifier: the
            // identifier appears in the name (case-insensitive), is not followed
            // by another digit, and the extension is .tif or .tiff.
            static bool matches(const std::string &filename, const std::string &id);

            // Return the file that holds the given band, or an empty string.
            std::string locate(const std::string &id) const;

            // Load the given bands. Throws MissingBandError listing every
            // band that cannot be located. The returned pointers are owned by
            // the loader.
            std::map<std::string, Band*> load(const std::vector<std::string> &ids);

            // The number of bands held in the cache.
            size_t cached() const;
        };

    } // bands

} // specindex

#endif
