#ifndef __ERRORS_HPP__
#define __ERRORS_HPP__

#include <stdexcept>
#include <string>
#include <vector>

#include "specindex.h"

namespace specindex {

    // One or more bands required by an index are absent from a scene.
    class DLL_EXPORT MissingBandError : public std::runtime_error {
    private:
        std::string m_scene;
        std::vector<std::string> m_bands;

        static std::string format(const std::string &scene, const std::vector<std::string> &bands);

    public:
        MissingBandError(const std::string &scene, const std::vector<std::string> &bands);

        // The scene the bands are missing from.
        const std::string& scene() const;

        // The missing band identifiers, in the order they were requested.
        const std::vector<std::string>& bands() const;

        // The missing bands joined by a space, e.g. "B5 B7".
        std::string bandList() const;
    };

    // Bands used together in a computation do not share dimensions.
    class DLL_EXPORT ShapeMismatchError : public std::runtime_error {
    public:
        ShapeMismatchError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // An index formula could not be evaluated.
    class DLL_EXPORT ComputationError : public std::runtime_error {
    public:
        ComputationError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // An output raster could not be persisted.
    class DLL_EXPORT WriteError : public std::runtime_error {
    public:
        WriteError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // The scene directory is missing, unreadable or malformed.
    class DLL_EXPORT SceneFatalError : public std::runtime_error {
    public:
        SceneFatalError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // The run cannot start (e.g. the input root is missing).
    class DLL_EXPORT SetupError : public std::runtime_error {
    public:
        SetupError(const std::string &msg) : std::runtime_error(msg) {}
    };

} // specindex

#endif
