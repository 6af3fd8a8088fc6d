#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace slotplanner {
namespace core {

// Ordered half-hour slot labels ("9:00", "9:30", ...) for one working day.
class SlotGrid
{
public:
    static constexpr int DefaultStartHour = 9;
    static constexpr int DefaultEndHour = 17;
    static constexpr int SlotLengthMinutes = 30;

    // Returns std::nullopt unless 0 <= startHour < endHour <= 24.
    static std::optional<SlotGrid> create(int startHour = DefaultStartHour, int endHour = DefaultEndHour);
    static bool isValidRange(int startHour, int endHour);

    int size() const;
    const QStringList &labels() const;
    QString label(int index) const;
    int indexOf(const QString &label) const;

private:
    SlotGrid(int startHour, int endHour);

    QStringList m_labels;
};

} // namespace core
} // namespace slotplanner
