#include <sstream>

#include "errors.hpp"

using namespace specindex;

std::string MissingBandError::format(const std::string &scene, const std::vector<std::string> &bands) {
	std::stringstream ss;
	ss << "Missing band(s) in " << scene << ":";
	for(const std::string &b : bands)
		ss << " " << b;
	return ss.str();
}

MissingBandError::MissingBandError(const std::string &scene, const std::vector<std::string> &bands) :
	std::runtime_error(format(scene, bands)),
	m_scene(scene),
	m_bands(bands) {
}

const std::string& MissingBandError::scene() const {
	return m_scene;
}

const std::vector<std::string>& MissingBandError::bands() const {
	return m_bands;
}

std::string MissingBandError::bandList() const {
	std::stringstream ss;
	for(size_t i = 0; i < m_bands.size(); ++i) {
		if(i > 0)
			ss << " ";
		ss << m_bands[i];
	}
	return ss.str();
}
