#include "sum.hpp"
#include <iostream>

int main()
{
    using sum_example::evaluate;

    // 1 + (2 + 3) + 4
    evaluate({{calc::digit{1}, 1, 1},
              {calc::plus(), 1, 3},
              {calc::left_parenthesis(), 1, 5},
              {calc::digit{2}, 1, 6},
              {calc::plus(), 1, 8},
              {calc::digit{3}, 1, 10},
              {calc::right_parenthesis(), 1, 11},
              {calc::plus(), 1, 13},
              {calc::digit{4}, 1, 15}},
             std::cout);

    // (1 + 2
    evaluate({{calc::left_parenthesis(), 1, 1}, {calc::digit{1}, 1, 2}, {calc::plus(), 1, 4}, {calc::digit{2}, 1, 6}},
             std::cout);

    // 5 )
    evaluate({{calc::digit{5}, 1, 1}, {calc::right_parenthesis(), 1, 3}}, std::cout);
}
