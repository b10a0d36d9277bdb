//
// Codepage identifier allocation
//

#include <bitfont/codepage/code_allocator.hh>
#include <failsafe/failsafe.hh>
#include <stdexcept>

namespace bitfont {

    std::uint16_t code_allocator::allocate() {
        THROW_IF(exhausted(), std::out_of_range,
                 "Codepage exhausted: only", CAPACITY, "identifiers are available");

        const std::uint16_t id = m_next;
        ++m_allocated;
        m_next = successor(id);
        return id;
    }

    std::vector<std::uint16_t> allocate_codes(const std::vector<admitted_character>& order) {
        THROW_IF(order.size() > code_allocator::CAPACITY, std::out_of_range,
                 "Corpus has", order.size(), "distinct characters but the codepage holds only",
                 code_allocator::CAPACITY);

        code_allocator allocator;
        std::vector<std::uint16_t> ids;
        ids.reserve(order.size());
        for (std::size_t i = 0; i < order.size(); ++i) {
            ids.push_back(allocator.allocate());
        }
        return ids;
    }

} // namespace bitfont
