#include <cctype>
#include <iomanip>
#include <sstream>

#include "tracer.hpp"

using namespace std;

// phase names end up in "/" separated paths
string sanitizeName(const string& s) {
	string result;
	for (auto c : s) {
		if (isalnum(static_cast<unsigned char>(c)) || (c == '_') || (c == '-')) {
			result.push_back(c);
		}
	}
	return result;
}

Tracer::Tracer(const string& name_, ostream* out_) :
		name(sanitizeName(name_)),
		out(out_),
		begin(steadyClock_t::now()) {}

Tracer::Tracer(const string& name_, shared_ptr<Tracer> parent_) :
		name(sanitizeName(name_)),
		out(parent_->out),
		begin(steadyClock_t::now()),
		parent(parent_) {}

Tracer::~Tracer() {
	auto ms = chrono::duration_cast<chrono::milliseconds>(steadyClock_t::now() - begin).count();

	stringstream ss;
	ss << getPath() << ": " << fixed << setprecision(2) << (ms / 1000.0) << " seconds";
	if (!note.empty()) {
		ss << " (" << note << ")";
	}
	ss << endl;

	if (out) {
		(*out) << ss.str();
	}
}

void Tracer::setNote(const string& note_) {
	note = note_;
}

string Tracer::getPath() const {
	if (parent) {
		return parent->getPath() + "/" + name;
	}
	return name;
}
