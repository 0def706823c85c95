#ifndef __BATCH_HPP__
#define __BATCH_HPP__

#include <vector>
#include <string>

#include "specindex.h"
#include "util.hpp"
#include "bands.hpp"
#include "indices.hpp"
#include "scene.hpp"

namespace specindex {

    namespace batch {

        namespace config {

            class DLL_EXPORT BatchConfig {
            public:
                std::string inputRoot;
                std::string outputRoot;
                std::string scene;      // Process only this scene, if given.
                std::vector<specindex::index::Index> indices;
                int threads;
                std::string logDir;
                specindex::bands::BandMap bandMap;
                specindex::index::IndexParams params;
                bool keepGrids;

                // Defaults: data/input, data/output, all indices, one thread
                // per processor, logs.
                BatchConfig();

                // Throws SetupError if the input root does not exist and
                // std::invalid_argument for other bad settings.
                void check() const;

                // The configuration for the scene processors of this run.
                specindex::scene::config::SceneConfig sceneConfig() const;
            };

        } // config

        // Runs the scene processor over a list of scenes in parallel. A
        // failing scene never stops the others.
        class DLL_EXPORT BatchRunner {
        private:
            config::BatchConfig m_config;
            specindex::util::Logger &m_log;
            specindex::util::Callbacks *m_callbacks;

            specindex::scene::SceneReport processScene(const specindex::scene::SceneProcessor &proc,
                    const std::string &scenePath, const std::vector<specindex::index::Index> &indices);

        public:
            BatchRunner(const config::BatchConfig &config, specindex::util::Logger &log);

            // Set the progress callbacks. Not owned; may be null.
            void setCallbacks(specindex::util::Callbacks *callbacks);

            // Return the paths of the scene directories under inputRoot, sorted
            // by name. If scene is given, returns only that scene. Throws
            // SetupError if the root or the named scene is missing.
            static std::vector<std::string> discover(const std::string &inputRoot,
                    const std::string &scene = std::string());

            // Process the scenes with at most concurrency workers. The reports
            // are returned in the order of scenePaths.
            std::vector<specindex::scene::SceneReport> run(const std::vector<std::string> &scenePaths,
                    const std::vector<specindex::index::Index> &indices, int concurrency);

            // Discover and process the scenes named by the configuration.
            std::vector<specindex::scene::SceneReport> run();
        };

    } // batch

} // specindex

#endif
