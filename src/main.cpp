#include "tadpole/bitboard.hpp"
#include "tadpole/misc.hpp"
#include "tadpole/uci.hpp"

using namespace Tadpole;

int main() {
    std::cout << engine_info() << std::endl;

    init_bitboards();

    UCIHandler uci;
    uci.loop();

    return 0;
}
