#include <algorithm>
#include <cctype>

#include <boost/filesystem.hpp>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "raster.hpp"
#include "bands.hpp"

using namespace specindex;
using namespace specindex::bands;
using namespace specindex::raster;
using namespace specindex::util;

std::string specindex::bands::roleName(Role role) {
	switch(role) {
	case Role::Blue:  return "Blue";
	case Role::Green: return "Green";
	case Role::Red:   return "Red";
	case Role::NIR:   return "NIR";
	case Role::SWIR1: return "SWIR1";
	case Role::SWIR2: return "SWIR2";
	}
	si_argerr("Unknown role: " << (int) role);
}

BandMap::BandMap() :
	m_sensor("landsat8") {
	m_ids[Role::Blue] = "B2";
	m_ids[Role::Green] = "B3";
	m_ids[Role::Red] = "B4";
	m_ids[Role::NIR] = "B5";
	m_ids[Role::SWIR1] = "B6";
	m_ids[Role::SWIR2] = "B7";
}

BandMap BandMap::landsat8() {
	return BandMap();
}

BandMap BandMap::sentinel2() {
	BandMap m;
	m.m_sensor = "sentinel2";
	m.m_ids[Role::Blue] = "B02";
	m.m_ids[Role::Green] = "B03";
	m.m_ids[Role::Red] = "B04";
	m.m_ids[Role::NIR] = "B08";
	m.m_ids[Role::SWIR1] = "B11";
	m.m_ids[Role::SWIR2] = "B12";
	return m;
}

BandMap BandMap::fromName(const std::string &name) {
	std::string n = Util::lower(name);
	if(n == "landsat8")
		return landsat8();
	if(n == "sentinel2")
		return sentinel2();
	si_argerr("Unknown sensor: " << name << ". Use landsat8 or sentinel2.");
}

const std::string& BandMap::sensor() const {
	return m_sensor;
}

const std::string& BandMap::id(Role role) const {
	auto it = m_ids.find(role);
	if(it == m_ids.end())
		si_argerr("No band assigned to role " << roleName(role));
	return it->second;
}

void BandMap::set(Role role, const std::string &id) {
	if(id.empty())
		si_argerr("Band identifier must not be empty.");
	m_ids[role] = id;
}

std::vector<std::string> BandMap::ids(const std::vector<Role> &roles) const {
	std::vector<std::string> out;
	for(const Role &r : roles)
		out.push_back(id(r));
	return out;
}


BandLoader::BandLoader(const std::string &scenePath, Logger &log) :
	m_path(scenePath),
	m_scene(Util::basename(scenePath)),
	m_log(log) {

	if(!Util::isDir(scenePath))
		si_throw(SceneFatalError, "Scene directory not found: " << scenePath);

	try {
		Util::dirlist(scenePath, m_files);
	} catch(const boost::filesystem::filesystem_error &e) {
		si_throw(SceneFatalError, "Scene directory could not be read: " << scenePath << ": " << e.what());
	}
	std::sort(m_files.begin(), m_files.end());
	si_debug(m_log, "Scene " << m_scene << ": " << m_files.size() << " files.");
}

const std::string& BandLoader::scene() const {
	return m_scene;
}

const std::string& BandLoader::path() const {
	return m_path;
}

bool BandLoader::matches(const std::string &filename, const std::string &id) {
	if(id.empty())
		return false;
	boost::filesystem::path p(filename);
	std::string ext = Util::lower(p.extension().string());
	if(ext != ".tif" && ext != ".tiff")
		return false;
	std::string stem = Util::lower(p.stem().string());
	std::string lid = Util::lower(id);
	size_t pos = stem.find(lid);
	while(pos != std::string::npos) {
		size_t end = pos + lid.size();
		if(end >= stem.size() || !std::isdigit((unsigned char) stem[end]))
			return true;
		pos = stem.find(lid, pos + 1);
	}
	return false;
}

std::string BandLoader::locate(const std::string &id) const {
	std::vector<std::string> found;
	for(const std::string &f : m_files) {
		if(matches(Util::basename(f), id))
			found.push_back(f);
	}
	if(found.empty())
		return std::string();
	if(found.size() > 1)
		si_warn(m_log, "Scene " << m_scene << ": " << found.size() << " files match band " << id << "; using " << Util::basename(found[0]));
	return found[0];
}

std::unique_ptr<Band> BandLoader::read(const std::string &id, const std::string &filename) {
	si_debug(m_log, "Scene " << m_scene << ": loading band " << id << " from " << filename);
	std::unique_ptr<Band> band(new Band());
	band->id = id;
	band->filename = filename;
	Raster<float> src(filename);
	band->grid.reset(new MemRaster<float>());
	src.readBlock(*band->grid);
	if(src.hasNodata())
		band->grid->nodata(src.nodata());
	band->georef = src.georef();
	return band;
}

std::map<std::string, Band*> BandLoader::load(const std::vector<std::string> &ids) {
	// Resolve every uncached band first so that nothing is read when any
	// band is missing.
	std::map<std::string, std::string> paths;
	std::vector<std::string> miss;
	for(const std::string &id : ids) {
		if(m_cache.find(id) != m_cache.end() || paths.find(id) != paths.end()
				|| std::find(miss.begin(), miss.end(), id) != miss.end())
			continue;
		std::string filename = locate(id);
		if(filename.empty()) {
			miss.push_back(id);
		} else {
			paths[id] = filename;
		}
	}
	if(!miss.empty())
		throw MissingBandError(m_scene, miss);

	std::map<std::string, Band*> out;
	for(const std::string &id : ids) {
		auto it = m_cache.find(id);
		if(it == m_cache.end()) {
			std::unique_ptr<Band> band = read(id, paths[id]);
			it = m_cache.insert(std::make_pair(id, std::move(band))).first;
		}
		out[id] = it->second.get();
	}
	return out;
}

size_t BandLoader::cached() const {
	return m_cache.size();
}
