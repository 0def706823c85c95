#include <vector>
#include <sstream>
#include <algorithm>
#include <fstream>
#include <string>
#include <ctime>
#include <cctype>

#include <boost/filesystem.hpp>

#include "specindex.h"
#include "util.hpp"

using namespace specindex::util;

Callbacks::~Callbacks() {}

Logger::Logger(int level) :
	m_level(level),
	m_console(&std::cerr) {
}

void Logger::open(const std::string &filename) {
	std::lock_guard<std::mutex> lk(m_mtx);
	boost::filesystem::path p(filename);
	if(p.has_parent_path() && !Util::mkdir(p.parent_path().string()))
		si_runerr("Failed to create log directory for " << filename);
	m_file.reset(new std::ofstream(filename.c_str(), std::ios::out | std::ios::app));
	if(!m_file->good()) {
		m_file.reset();
		si_runerr("Failed to open log file: " << filename);
	}
	m_filename = filename;
}

void Logger::close() {
	std::lock_guard<std::mutex> lk(m_mtx);
	if(m_file.get())
		m_file->close();
	m_file.reset();
	m_filename.clear();
}

const std::string& Logger::filename() const {
	return m_filename;
}

void Logger::console(std::ostream *str) {
	std::lock_guard<std::mutex> lk(m_mtx);
	m_console = str;
}

int Logger::level() const {
	return m_level;
}

void Logger::level(int level) {
	m_level = level;
}

const char* Logger::levelName(int level) {
	switch(level) {
	case SI_LOG_TRACE: return "TRACE";
	case SI_LOG_DEBUG: return "DEBUG";
	case SI_LOG_INFO:  return "INFO";
	case SI_LOG_WARN:  return "WARNING";
	case SI_LOG_ERROR: return "ERROR";
	default:           return "NONE";
	}
}

void Logger::write(int level, const std::string &msg) {
	std::stringstream line;
	line << Util::timestamp("%Y-%m-%d %H:%M:%S") << " - " << levelName(level) << " - " << msg << "\n";
	const std::string str = line.str();
	std::lock_guard<std::mutex> lk(m_mtx);
	if(m_file.get()) {
		*m_file << str;
		m_file->flush();
	}
	if(m_console) {
		*m_console << str;
		m_console->flush();
	}
}

Logger::~Logger() {
	if(m_file.get())
		m_file->close();
}

void Util::splitString(const std::string &str, std::vector<std::string> &lst) {
	std::stringstream ss(str);
	std::string item;
	while(std::getline(ss, item, ',')) {
		if(!item.empty())
			lst.push_back(item);
	}
}

void Util::status(int step, int of, const std::string &message, bool end) {
	#pragma omp critical(__status)
	{
		if(step < 0)  step = 0;
		if(of <= 0)   of = 1;
		if(step > of) of = step;
		float status = (float) (step * 100) / of;
		std::stringstream out;
		out << "Status: " << std::fixed << std::setprecision(2) << status << "% " << message << std::right << std::setw(100) << std::setfill(' ');
		if(end)
			out << std::endl;
		else
			out << '\r';
		std::cerr << out.str();
		std::cerr.flush();
	}
}

std::string Util::timestamp(const std::string &fmt) {
	std::time_t t = std::time(nullptr);
	std::tm tm;
#ifdef _MSC_VER
	localtime_s(&tm, &t);
#else
	localtime_r(&t, &tm);
#endif
	char buf[128];
	size_t len = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
	return std::string(buf, len);
}

bool Util::rm(const std::string &name) {
	using namespace boost::filesystem;
	path p(name);
	return remove_all(p) > 0;
}

bool Util::mkdir(const std::string &dir) {
	using namespace boost::filesystem;
	path bdir(dir);
	boost::system::error_code ec;
	if(!boost::filesystem::exists(bdir, ec))
		create_directories(bdir, ec);
	return is_directory(bdir, ec);
}

bool Util::exists(const std::string &name) {
	boost::system::error_code ec;
	return boost::filesystem::exists(boost::filesystem::path(name), ec);
}

bool Util::isDir(const std::string &name) {
	boost::system::error_code ec;
	return boost::filesystem::is_directory(boost::filesystem::path(name), ec);
}

std::string Util::join(const std::string &a, const std::string &b) {
	return (boost::filesystem::path(a) / boost::filesystem::path(b)).string();
}

std::string Util::basename(const std::string &path) {
	boost::filesystem::path p(path);
	// A trailing separator gives an empty filename ("."); strip it first.
	if(p.filename() == "." && p.has_parent_path())
		p = p.parent_path();
	return p.filename().string();
}

int Util::dirlist(const std::string &dir, std::vector<std::string> &files, const std::string &ext) {
	using namespace boost::filesystem;
	path p(dir);
	if(is_regular_file(p)) {
		files.push_back(p.string());
		return 1;
	}
	std::string lext = lower(ext);
	int count = 0;
	directory_iterator end;
	for(directory_iterator it(p); it != end; ++it) {
		if(!is_regular_file(it->status()))
			continue;
		std::string name = it->path().string();
		if(!lext.empty() && lower(it->path().extension().string()) != lext)
			continue;
		files.push_back(name);
		++count;
	}
	return count;
}

int Util::subdirs(const std::string &dir, std::vector<std::string> &names) {
	using namespace boost::filesystem;
	std::vector<std::string> found;
	directory_iterator end;
	for(directory_iterator it((path(dir))); it != end; ++it) {
		if(is_directory(it->status()))
			found.push_back(it->path().filename().string());
	}
	std::sort(found.begin(), found.end());
	names.insert(names.end(), found.begin(), found.end());
	return (int) found.size();
}

std::string Util::lower(const std::string &str) {
	std::string s(str);
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char) std::tolower(c); });
	return s;
}

std::string Util::upper(const std::string &str) {
	std::string s(str);
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char) std::toupper(c); });
	return s;
}
