#include "sample.hpp"
#include <fstream>
#include <stdexcept>

static const char* AMHAPY_SAMPLE = R"amha(# የአምሃፓይ ምሳሌ ፕሮግራም

አሳይ "ሰላም ለአምሃፓይ!"

ስም = "ሄለን"
ነጥብ = 72
ዓመት = 19

አሳይ "ስም:", ስም
አሳይ "ነጥብ:", ነጥብ

ከሆነ ነጥብ ትልቅ_ወይም_እኩል 50:
    አሳይ ስም, "አልፋለች"
    ከሆነ ዓመት ትልቅ 18:
        አሳይ "ለመመዝገብ ብቁ ናት"
ያለበለዚያ_ከሆነ ነጥብ ትልቅ 40:
    አሳይ "ድጋሚ ፈተና"
ያለበለዚያ:
    አሳይ "አልተሳካም"

ቆጣሪ = 3
እስከሆነ ቆጣሪ ትልቅ 0:
    አሳይ "ቆጠራ:", ቆጣሪ
    ቆጣሪ = ቆጣሪ - 1

ለ ቁ በ ክልል(1, 4):
    አሳይ "ዙር:", ቁ

ሥራ ድምር(ሀ, ሁ):
    # ሁለት ቁጥሮችን ይደምራል
    ውጤት = ሀ + ሁ
    መመለስ ውጤት

ጠቅላላ = ድምር(15, 25)
አሳይ "ድምር:", ጠቅላላ

ዝግጁ = እውነት
ከሆነ ዝግጁ እና አይደለም ሐሰት:
    አሳይ "ተጠናቋል።"
ያለበለዚያ:
    አሳይ ነጥብ እኩል 0 ወይም ዓመት ትንሽ_ወይም_እኩል 18
)amha";

std::string_view sample_program() {
    return AMHAPY_SAMPLE;
}

void write_sample(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::binary);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path);
    out << sample_program();
    if (!out) throw std::runtime_error("Failed to write sample program: " + path);
}
