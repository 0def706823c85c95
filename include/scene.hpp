#ifndef __SCENE_HPP__
#define __SCENE_HPP__

#include <vector>
#include <string>
#include <memory>

#include "specindex.h"
#include "util.hpp"
#include "raster.hpp"
#include "bands.hpp"
#include "indices.hpp"

namespace specindex {

    namespace scene {

        enum class Status {
            Success,
            Failed,
            Skipped
        };

        // Return the label for a status, e.g. "success".
        std::string statusName(Status status);

        // The outcome of computing one index for one scene.
        class DLL_EXPORT IndexResult {
        public:
            specindex::index::Index index;
            Status status;
            std::string reason;     // Why the index failed or was skipped.
            std::string filename;   // The output raster, if written.
            double elapsed;         // Seconds.
            std::shared_ptr<specindex::raster::MemRaster<float> > grid; // Only retained if configured.

            IndexResult(specindex::index::Index index);

            bool ok() const;
        };

        // The results for one scene, in the order the indices were requested.
        class DLL_EXPORT SceneReport {
        public:
            std::string scene;
            std::vector<IndexResult> results;
            double elapsed;         // Seconds.
            bool fatal;             // True if the whole scene failed.
            std::string error;      // The scene-level error, if fatal.

            SceneReport(const std::string &scene = std::string());

            // Return the result for the index, or null if it was not requested.
            const IndexResult* result(specindex::index::Index index) const;

            // Mark the scene as failed, with a failed result for each index.
            void fail(const std::vector<specindex::index::Index> &indices, const std::string &reason);

            size_t succeeded() const;

            size_t failed() const;

            size_t skipped() const;
        };

        namespace config {

            class SceneConfig {
            public:
                std::string outputRoot;
                specindex::bands::BandMap bandMap;
                specindex::index::IndexParams params;
                bool keepGrids;

                SceneConfig() :
                    keepGrids(false) {
                }

                void check() const {
                    if (outputRoot.empty())
                        si_argerr("The output directory must be given.");
                    params.check();
                }
            };

        } // config

        // Computes the requested indices for a scene and writes one raster
        // per index to <outputRoot>/<scene>/<INDEX>.tif. Failures are
        // recorded per index; only SceneFatalError affects the whole scene,
        // and it too ends up in the report rather than propagating.
        class DLL_EXPORT SceneProcessor {
        private:
            config::SceneConfig m_config;
            specindex::util::Logger &m_log;

            IndexResult processIndex(specindex::bands::BandLoader &loader, specindex::index::Index index,
                    const std::string &outDir) const;

            // Write the grid as a Float32 GeoTIFF with the given spatial reference.
            // Throws WriteError.
            void write(specindex::raster::MemRaster<float> &grid, const specindex::raster::GeoRef &georef,
                    const std::string &outDir, const std::string &filename) const;

        public:
            SceneProcessor(const config::SceneConfig &config, specindex::util::Logger &log);

            SceneReport process(const std::string &scenePath, const std::vector<specindex::index::Index> &indices) const;

            // The output directory for the named scene.
            std::string outputDir(const std::string &scene) const;
        };

    } // scene

} // specindex

#endif
