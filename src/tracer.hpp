#ifndef TRACER_HPP
#define TRACER_HPP

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

/*
 * Scoped phase timer. Writes "<path>: <seconds> seconds [(<note>)]" to the profile
 * stream when destroyed; the path joins the names of all parent tracers with "/".
 */
class Tracer {
	public:
		Tracer(const std::string& name, std::ostream* out);
		Tracer(const std::string& name, std::shared_ptr<Tracer> parent);
		~Tracer();

		std::string getPath() const;

		// extra info for the profile line, e.g. the size of a generated level
		void setNote(const std::string& note);

	private:
		typedef std::chrono::steady_clock steadyClock_t;

		std::string name;
		std::string note;
		std::ostream* out;
		steadyClock_t::time_point begin;
		std::shared_ptr<Tracer> parent;
};

typedef std::shared_ptr<Tracer> tracer_t;

#endif
