#ifndef TEMPLATEBUILDERDIALOG_H
#define TEMPLATEBUILDERDIALOG_H

#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dialog.h>

#include "TemplateBuilder.h"

#include <vector>

class wxPanel;
class wxScrolledWindow;
class wxStaticText;
class wxTextCtrl;
class wxMouseEvent;
class wxMouseCaptureLostEvent;

// Row of draggable column markers alternating with separator entries, followed by the
// extension. Dragging a marker and releasing it over another cell moves that column.
class TemplateBuilderDialog : public wxDialog
{
public:
	TemplateBuilderDialog(wxWindow *parent, const TemplateBuilder &builder);

	NameTemplate GetTemplate() const { return m_builder.Build(); }

private:
	TemplateBuilder m_builder;
	int m_dragIndex;

	wxScrolledWindow *canvas;
	std::vector<wxPanel *> m_markers;
	std::vector<wxStaticText *> m_markerLabels;
	std::vector<wxTextCtrl *> m_separatorCtrls;
	wxStaticText *previewLabel;

	void BindMarker(wxWindow *window, std::size_t index);
	void OnMarkerDown(std::size_t index);
	void OnMarkerUp(wxMouseEvent &event);
	void OnCaptureLost(wxMouseCaptureLostEvent &event);
	void OnSeparatorText(std::size_t slot);
	void OnAccept(wxCommandEvent &event);
	void EndDrag();
	void RefreshMarkers();
	void RefreshPreview();
};

#endif // TEMPLATEBUILDERDIALOG_H
