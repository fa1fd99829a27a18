#ifndef SYS_HPP
#define SYS_HPP

#include <cstddef>
#include <map>
#include <vector>

typedef long number_t;
typedef std::vector<number_t> clique_t;
typedef std::vector<clique_t> cliques_t;
typedef std::map<number_t, std::size_t> membership_t;
typedef std::map<number_t, std::size_t> breakdown_t;

#endif
